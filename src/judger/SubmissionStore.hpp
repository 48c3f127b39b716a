/*
 * SubmissionStore.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_SUBMISSIONSTORE_HPP_
#define SRC_JUDGER_SUBMISSIONSTORE_HPP_

#include "Result.hpp"
#include "db_typedef.hpp"

#include <memory>
#include <string>
#include <vector>

struct Challenge
{
		cc::challenge_id_type id;
		cc::user_id_type creator;
		std::string description;
		cc::time_in_milliseconds time_limit;
		cc::mem_in_MB memory_limit;
		int static_tests;
		int random_tests;
		std::string evaluator;
		std::string solution_environment;
		std::string solution_code;
		cc::reward_literal xp; ///< 首次解决时发放的经验
		cc::reward_literal coins; ///< 首次解决时发放的金币

		Challenge() :
				time_limit(0), memory_limit(0), static_tests(0), random_tests(0), xp(0), coins(0)
		{
		}
};

/**
 * @brief 提交. 创建后不再修改
 */
struct Submission
{
		cc::submission_id_type id;
		cc::challenge_id_type challenge_id;
		cc::user_id_type creator;
		cc::timestamp_type creation_timestamp;
		std::string environment;
		std::string code;
};

/**
 * @brief 提交的评测结果, 与提交一一对应. 不存在表示仍在评测
 * build 与 run 中的 std_out 不入库
 */
struct SubmissionResult
{
		cc::submission_id_type submission_id;
		Verdict verdict;
		optional<std::string> reason;
		optional<PhaseResult> build;
		optional<PhaseResult> run;

		SubmissionResult() :
				verdict(Verdict::OK)
		{
		}

		SubmissionResult(const cc::submission_id_type & submission_id, const CheckResult & result) :
				submission_id(submission_id), verdict(result.verdict), reason(result.reason),
				build(result.compile), run(result.run)
		{
		}
};

/**
 * @brief 用户在一道题上的进度
 */
struct UserChallengeProgress
{
		cc::user_id_type user_id;
		cc::challenge_id_type challenge_id;
		optional<cc::timestamp_type> unlocked_timestamp;
		optional<cc::timestamp_type> solved_timestamp; ///< 至多设置一次
		optional<cc::timestamp_type> last_attempt_timestamp;
		std::int32_t attempts;
		optional<std::int32_t> rating;

		UserChallengeProgress() :
				attempts(0)
		{
		}

		bool solved() const
		{
			return solved_timestamp != nullopt;
		}
};

void to_json(nlohmann::json & j, const Challenge & src);
void to_json(nlohmann::json & j, const Submission & src);
void to_json(nlohmann::json & j, const SubmissionResult & src);

/**
 * @brief 一次数据库事务. 析构时若未提交则回滚
 * 所有操作失败时抛出 StoreException
 */
class StoreTransaction
{
	public:
		virtual ~StoreTransaction() noexcept = default;

		virtual optional<Challenge> find_challenge(const cc::challenge_id_type & id) = 0;

		virtual void insert_challenge(const Challenge & challenge) = 0;

		virtual void update_challenge(const Challenge & challenge) = 0;

		virtual void insert_submission(const Submission & submission) = 0;

		virtual optional<Submission> find_submission(const cc::submission_id_type & id) = 0;

		/**
		 * @brief 用户在某题下的全部提交, 按创建时间降序
		 */
		virtual std::vector<Submission> find_submissions(const cc::challenge_id_type & challenge_id, const cc::user_id_type & user_id) = 0;

		/**
		 * @brief 所有没有评测结果的提交, 按创建时间升序
		 */
		virtual std::vector<Submission> find_pending_submissions() = 0;

		virtual void insert_result(const SubmissionResult & result) = 0;

		virtual optional<SubmissionResult> find_result(const cc::submission_id_type & submission_id) = 0;

		/**
		 * @brief 读取进度. 实现须读到最新提交的数据 (如加锁读)
		 */
		virtual optional<UserChallengeProgress> find_progress(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id) = 0;

		/**
		 * @brief 尝试次数原子地加一并更新最后尝试时间, 进度不存在时创建
		 */
		virtual void record_attempt(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp) = 0;

		/**
		 * @brief 设置解决时间, 已解决时不做改变
		 */
		virtual void mark_solved(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp) = 0;

		virtual void commit() = 0;

		virtual void rollback() = 0;
};

/**
 * @brief 持久化层. 实现必须可以被多个线程同时调用
 */
class SubmissionStore
{
	public:
		virtual ~SubmissionStore() noexcept = default;

		/**
		 * @throws StoreException
		 */
		virtual std::unique_ptr<StoreTransaction> begin() = 0;
};

#endif /* SRC_JUDGER_SUBMISSIONSTORE_HPP_ */
