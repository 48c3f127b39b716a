/*
 * JudgeJob.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_JUDGEJOB_HPP_
#define SRC_JUDGER_JUDGEJOB_HPP_

#include "ChallengeChecker.hpp"
#include "RewardSerializer.hpp"
#include "RewardService.hpp"
#include "SubmissionStore.hpp"

/**
 * @brief 一个提交的评测任务, 在评测线程上执行
 *
 * 在一个事务中完成: 评测 -> (通过时) 取得 (题目, 用户) 锁, 标记解决并发放奖励 -> 写入评测结果 -> 提交事务.
 * 评测程序故障, 环境不存在或基础设施故障时回滚事务并记录日志, 该提交保持未评测状态.
 */
class JudgeJob
{
	private:
		const Submission submission;
		SubmissionStore & store;
		ChallengeChecker & checker;
		RewardSerializer & reward_serializer;
		RewardService & reward_service;

		void record_solved(StoreTransaction & trans, const Challenge & challenge);

		void record_failed(StoreTransaction & trans, const CheckResult & result);

	public:
		JudgeJob(const Submission & submission, SubmissionStore & store, ChallengeChecker & checker,
					RewardSerializer & reward_serializer, RewardService & reward_service);

		/**
		 * @brief 评测该提交
		 * @return 是否写入了评测结果
		 * @throw 该函数保证不抛出任何异常
		 */
		bool handle() noexcept;
};

#endif /* SRC_JUDGER_JUDGEJOB_HPP_ */
