/*
 * JudgeJob.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "JudgeJob.hpp"
#include "judge_exception.hpp"
#include "logger.hpp"

extern std::ofstream log_fp;

JudgeJob::JudgeJob(const Submission & submission, SubmissionStore & store, ChallengeChecker & checker,
					RewardSerializer & reward_serializer, RewardService & reward_service) :
		submission(submission), store(store), checker(checker),
		reward_serializer(reward_serializer), reward_service(reward_service)
{
}

void JudgeJob::record_solved(StoreTransaction & trans, const Challenge & challenge)
{
	trans.record_attempt(submission.creator, challenge.id, submission.creation_timestamp);

	reward_serializer.with_lock(RewardKey {challenge.id, submission.creator}, [&]() {
		optional<UserChallengeProgress> progress = trans.find_progress(submission.creator, challenge.id);
		if (progress == nullopt || !(*progress).solved()) {
			trans.mark_solved(submission.creator, challenge.id, submission.creation_timestamp);
			if (submission.creator != challenge.creator) {
				reward_service.add_reward(submission.creator, challenge.xp, challenge.coins);
				LOG_INFO(log_kind::SUBMISSION, submission.id, log_fp, "Rewarded xp: ", challenge.xp, " coins: ", challenge.coins);
			}
		}
		trans.insert_result(SubmissionResult(submission.id, CheckResult(Verdict::OK)));
		trans.commit();
	});
}

void JudgeJob::record_failed(StoreTransaction & trans, const CheckResult & result)
{
	trans.record_attempt(submission.creator, submission.challenge_id, submission.creation_timestamp);
	trans.insert_result(SubmissionResult(submission.id, result));
	trans.commit();
}

bool JudgeJob::handle() noexcept
{
	LOG_INFO(log_kind::SUBMISSION, submission.id, log_fp, "<<<<<<<<<<<<<<<<<<<<<<<<<<<<<<");
	PROFILE_HEAD

	std::unique_ptr<StoreTransaction> trans;
	try {
		trans = store.begin();
	} catch (const std::exception & e) {
		EXCEPT_FATAL(log_kind::SUBMISSION, submission.id, log_fp, "Begin transaction failed.", e);
		return false;
	}

	try {
		optional<Challenge> challenge = trans->find_challenge(submission.challenge_id);
		if (challenge == nullopt) {
			LOG_FATAL(log_kind::SUBMISSION, submission.id, log_fp, "Challenge doesn't exist. challenge: ", submission.challenge_id);
			trans->rollback();
			return false;
		}

		Solution solution;
		solution.environment = submission.environment;
		solution.code = submission.code;
		solution.time_limit = (*challenge).time_limit;
		solution.memory_limit = (*challenge).memory_limit;

		CheckOutcome outcome = checker.check_challenge((*challenge).evaluator, (*challenge).id, solution,
														(*challenge).static_tests, (*challenge).random_tests);

		switch (outcome.kind) {
			case CheckErrorKind::SUCCESS:
				this->record_solved(*trans, *challenge);
				LOG_INFO(log_kind::SUBMISSION, submission.id, log_fp, "Judge finished. verdict: ", Verdict::OK);
				break;
			case CheckErrorKind::TESTCASE_FAILED:
				this->record_failed(*trans, outcome.result);
				LOG_INFO(log_kind::SUBMISSION, submission.id, log_fp, "Judge finished. seed: ", outcome.seed, " ", outcome.result);
				break;
			case CheckErrorKind::NO_EXAMPLES:
			case CheckErrorKind::ENVIRONMENT_NOT_FOUND:
			case CheckErrorKind::EVALUATOR_FAILED:
			case CheckErrorKind::INVALID_OUTPUT:
			case CheckErrorKind::LIMIT_EXCEEDED:
				LOG_FATAL(log_kind::SUBMISSION, submission.id, log_fp, "Judge aborted. ", outcome);
				trans->rollback();
				return false;
		}
	} catch (const std::exception & e) {
		EXCEPT_FATAL(log_kind::SUBMISSION, submission.id, log_fp, "Judge submission failed.", e);
		try {
			trans->rollback();
		} catch (const std::exception & rollback_error) {
			EXCEPT_FATAL(log_kind::SUBMISSION, submission.id, log_fp, "Rollback failed.", rollback_error);
		}
		return false;
	}

	PROFILE_TAIL(log_kind::SUBMISSION, submission.id, log_fp);
	LOG_INFO(log_kind::SUBMISSION, submission.id, log_fp, ">>>>>>>>>>>>>>>>>>>>>>>>>>>>>>");
	return true;
}
