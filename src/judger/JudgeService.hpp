/*
 * JudgeService.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_JUDGESERVICE_HPP_
#define SRC_JUDGER_JUDGESERVICE_HPP_

#include "ChallengeChecker.hpp"
#include "JudgeScheduler.hpp"
#include "RewardSerializer.hpp"
#include "RewardService.hpp"
#include "SubmissionStore.hpp"

#include <kerbal/utility/noncopyable.hpp>

#include <mutex>
#include <string>
#include <vector>

/**
 * @brief 平台对题目的限制
 */
struct ChallengeLimits
{
		int max_static_tests;
		int max_random_tests;
};

/**
 * @brief 对已有题目的修改, 为空的字段保持原值
 */
struct ChallengePatch
{
		optional<std::string> description;
		optional<cc::time_in_milliseconds> time_limit;
		optional<cc::mem_in_MB> memory_limit;
		optional<int> static_tests;
		optional<int> random_tests;
		optional<std::string> evaluator;
		optional<std::string> solution_environment;
		optional<std::string> solution_code;
		optional<cc::reward_literal> xp;
		optional<cc::reward_literal> coins;

		void apply_to(Challenge & challenge) const;
};

/**
 * @brief 写入题目的结果. outcome 未通过时题目不会入库
 */
struct ChallengeWriteResult
{
		CheckOutcome outcome;
		Challenge challenge;
};

struct SubmitReceipt
{
		cc::submission_id_type submission_id;
		std::uint64_t queue_position;
};

/**
 * @brief 提交及其当前状态
 */
struct SubmissionView
{
		Submission submission;
		optional<SubmissionResult> result; ///< 为空表示尚未评测完
		optional<std::uint64_t> queue_position; ///< 为空表示不在队中
};

void to_json(nlohmann::json & j, const SubmitReceipt & src);
void to_json(nlohmann::json & j, const SubmissionView & src);

/**
 * @brief 评测服务对外的全部操作
 *
 * 提交在 submit 中同步入库, 评测则在 JudgeScheduler 的评测线程上异步进行.
 * 题目校验, 样例生成与样例试运行在调用者的线程上同步进行.
 */
class JudgeService : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		Sandbox & sandbox;
		SubmissionStore & store;
		RewardService & reward_service;
		EvaluatorCache & cache;
		const ChallengeLimits limits;

		ChallengeChecker checker;
		RewardSerializer reward_serializer;
		JudgeScheduler scheduler;

		std::mutex sandbox_info_mtx;
		std::vector<std::string> environments; ///< 沙箱环境列表的本地副本
		optional<ExecutorConfig> executor_config;

		Challenge find_challenge(const cc::challenge_id_type & challenge_id);

		ExecutorConfig get_executor_config();

		std::uint64_t schedule(const Submission & submission);

	public:
		JudgeService(Sandbox & sandbox, SubmissionStore & store, RewardService & reward_service,
						EvaluatorCache & cache, const EvaluatorRuntime & runtime,
						const ChallengeLimits & limits, std::size_t workers);

		/**
		 * @brief 沙箱是否提供 environment. 本地副本中没有时会重新向沙箱查询一次
		 * @throws SandboxException
		 */
		bool environment_exists(const std::string & environment);

		/**
		 * @brief 创建提交并将其评测任务入队
		 * @throws NotFoundException 题目不存在
		 * @throws EnvironmentNotFoundException
		 */
		SubmitReceipt submit(const cc::challenge_id_type & challenge_id, const cc::user_id_type & user_id,
								const std::string & environment, const std::string & code);

		optional<SubmissionResult> get_result(const cc::submission_id_type & submission_id);

		optional<SubmissionView> get_submission(const cc::submission_id_type & submission_id);

		/**
		 * @brief 用户在某题下的全部提交, 新的在前
		 * @throws NotFoundException 题目不存在
		 */
		std::vector<SubmissionView> list_submissions(const cc::challenge_id_type & challenge_id,
														const cc::user_id_type & user_id);

		optional<std::uint64_t> get_queue_position(const cc::submission_id_type & submission_id);

		QueueStatus queue_status();

		/**
		 * @brief 先检查平台限制, 再以参考解法跑完所有 seed
		 * draft 的 id 为空时只用于生成固定 seed, 不会回写
		 */
		CheckOutcome validate_challenge(const Challenge & draft);

		/**
		 * @brief 校验通过后为题目分配 id 并入库
		 */
		ChallengeWriteResult create_challenge(const Challenge & draft);

		/**
		 * @brief 以 patch 修改题目, 校验通过后入库并清除该题的评测缓存
		 * @throws NotFoundException 题目不存在
		 */
		ChallengeWriteResult update_challenge(const cc::challenge_id_type & challenge_id, const ChallengePatch & patch);

		/**
		 * @throws NotFoundException 题目不存在
		 * @throws EvaluatorException
		 * @throws ExampleGenerationFailedException
		 */
		std::vector<Example> list_examples(const cc::challenge_id_type & challenge_id);

		/**
		 * @throws NotFoundException 题目或样例不存在
		 * @throws EnvironmentNotFoundException
		 * @throws EvaluatorException
		 */
		CheckResult test_example(const cc::challenge_id_type & challenge_id, const std::string & example_id,
									const std::string & environment, const std::string & code);

		/**
		 * @brief 将所有没有评测结果的提交按创建时间顺序重新入队, 用于启动时恢复
		 * @return 入队的提交数
		 */
		std::size_t resume_pending();

		/**
		 * @brief 等待已入队的评测任务全部完成
		 */
		void shutdown() noexcept;
};

#endif /* SRC_JUDGER_JUDGESERVICE_HPP_ */
