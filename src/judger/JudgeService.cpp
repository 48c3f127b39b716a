/*
 * JudgeService.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "JudgeService.hpp"
#include "JudgeJob.hpp"
#include "judge_exception.hpp"
#include "logger.hpp"

#include <boost/format.hpp>

#include <algorithm>

extern std::ofstream log_fp;

void ChallengePatch::apply_to(Challenge & challenge) const
{
	if (description != nullopt) {
		challenge.description = *description;
	}
	if (time_limit != nullopt) {
		challenge.time_limit = *time_limit;
	}
	if (memory_limit != nullopt) {
		challenge.memory_limit = *memory_limit;
	}
	if (static_tests != nullopt) {
		challenge.static_tests = *static_tests;
	}
	if (random_tests != nullopt) {
		challenge.random_tests = *random_tests;
	}
	if (evaluator != nullopt) {
		challenge.evaluator = *evaluator;
	}
	if (solution_environment != nullopt) {
		challenge.solution_environment = *solution_environment;
	}
	if (solution_code != nullopt) {
		challenge.solution_code = *solution_code;
	}
	if (xp != nullopt) {
		challenge.xp = *xp;
	}
	if (coins != nullopt) {
		challenge.coins = *coins;
	}
}

void to_json(nlohmann::json & j, const SubmitReceipt & src)
{
	j = nlohmann::json {
		{"submission_id", src.submission_id.to_string()},
		{"queue_position", src.queue_position},
	};
}

void to_json(nlohmann::json & j, const SubmissionView & src)
{
	j = src.submission;
	j["result"] = src.result != nullopt ? nlohmann::json(*src.result) : nlohmann::json(nullptr);
	j["queue_position"] = src.queue_position != nullopt ? nlohmann::json(*src.queue_position) : nlohmann::json(nullptr);
}

JudgeService::JudgeService(Sandbox & sandbox, SubmissionStore & store, RewardService & reward_service,
							EvaluatorCache & cache, const EvaluatorRuntime & runtime,
							const ChallengeLimits & limits, std::size_t workers) :
		sandbox(sandbox), store(store), reward_service(reward_service), cache(cache), limits(limits),
		checker(sandbox, cache, runtime), scheduler(workers)
{
}

Challenge JudgeService::find_challenge(const cc::challenge_id_type & challenge_id)
{
	std::unique_ptr<StoreTransaction> trans = store.begin();
	optional<Challenge> challenge = trans->find_challenge(challenge_id);
	if (challenge == nullopt) {
		throw NotFoundException("challenge not found: " + challenge_id.to_string());
	}
	return *challenge;
}

bool JudgeService::environment_exists(const std::string & environment)
{
	std::lock_guard<std::mutex> lck(sandbox_info_mtx);
	if (std::find(environments.begin(), environments.end(), environment) != environments.end()) {
		return true;
	}
	environments = sandbox.list_environments();
	LOG_DEBUG(log_kind::JUDGER, 0, log_fp, "Environment list refreshed, size: ", environments.size());
	return std::find(environments.begin(), environments.end(), environment) != environments.end();
}

ExecutorConfig JudgeService::get_executor_config()
{
	std::lock_guard<std::mutex> lck(sandbox_info_mtx);
	if (executor_config == nullopt) {
		executor_config = sandbox.get_config();
	}
	return *executor_config;
}

std::uint64_t JudgeService::schedule(const Submission & submission)
{
	return scheduler.enqueue(submission.id, [this, submission]() {
		JudgeJob job(submission, store, checker, reward_serializer, reward_service);
		job.handle();
	});
}

SubmitReceipt JudgeService::submit(const cc::challenge_id_type & challenge_id, const cc::user_id_type & user_id,
									const std::string & environment, const std::string & code)
{
	// 查询沙箱时不占用数据库连接
	this->find_challenge(challenge_id);
	if (!this->environment_exists(environment)) {
		throw EnvironmentNotFoundException(environment);
	}

	Submission submission;
	{
		std::unique_ptr<StoreTransaction> trans = store.begin();
		submission.id = cc::submission_id_type::generate();
		submission.challenge_id = challenge_id;
		submission.creator = user_id;
		submission.creation_timestamp = std::chrono::system_clock::now();
		submission.environment = environment;
		submission.code = code;

		trans->insert_submission(submission);
		trans->commit();
	}

	SubmitReceipt receipt;
	receipt.submission_id = submission.id;
	receipt.queue_position = this->schedule(submission);
	LOG_INFO(log_kind::SUBMISSION, submission.id, log_fp, "Submission accepted. challenge: ", challenge_id,
				" user: ", user_id, " queue position: ", receipt.queue_position);
	return receipt;
}

optional<SubmissionResult> JudgeService::get_result(const cc::submission_id_type & submission_id)
{
	std::unique_ptr<StoreTransaction> trans = store.begin();
	return trans->find_result(submission_id);
}

optional<SubmissionView> JudgeService::get_submission(const cc::submission_id_type & submission_id)
{
	std::unique_ptr<StoreTransaction> trans = store.begin();
	optional<Submission> submission = trans->find_submission(submission_id);
	if (submission == nullopt) {
		return nullopt;
	}

	SubmissionView view;
	view.submission = *submission;
	view.result = trans->find_result(submission_id);
	if (view.result == nullopt) {
		view.queue_position = scheduler.position(submission_id);
	}
	return view;
}

std::vector<SubmissionView> JudgeService::list_submissions(const cc::challenge_id_type & challenge_id,
																const cc::user_id_type & user_id)
{
	std::unique_ptr<StoreTransaction> trans = store.begin();
	if (trans->find_challenge(challenge_id) == nullopt) {
		throw NotFoundException("challenge not found: " + challenge_id.to_string());
	}

	std::vector<SubmissionView> views;
	for (Submission & submission : trans->find_submissions(challenge_id, user_id)) {
		SubmissionView view;
		view.result = trans->find_result(submission.id);
		if (view.result == nullopt) {
			view.queue_position = scheduler.position(submission.id);
		}
		view.submission = std::move(submission);
		views.push_back(std::move(view));
	}
	return views;
}

optional<std::uint64_t> JudgeService::get_queue_position(const cc::submission_id_type & submission_id)
{
	return scheduler.position(submission_id);
}

QueueStatus JudgeService::queue_status()
{
	return scheduler.status();
}

CheckOutcome JudgeService::validate_challenge(const Challenge & draft)
{
	cc::challenge_id_type challenge_id = draft.id.is_nil() ? cc::challenge_id_type::generate() : draft.id;

	ExecutorConfig config = this->get_executor_config();

	if (draft.time_limit.count() < 1 || draft.time_limit > config.max_time_limit) {
		return CheckOutcome::with_message(CheckErrorKind::LIMIT_EXCEEDED,
				(boost::format("time_limit must be between 1 and %d ms") % config.max_time_limit.count()).str());
	}
	if (draft.memory_limit.count() < 1 || draft.memory_limit.count() > config.max_memory_limit.count()) {
		return CheckOutcome::with_message(CheckErrorKind::LIMIT_EXCEEDED,
				(boost::format("memory_limit must be between 1 and %d MB") % config.max_memory_limit.count()).str());
	}
	if (draft.static_tests < 0 || draft.static_tests > limits.max_static_tests) {
		return CheckOutcome::with_message(CheckErrorKind::LIMIT_EXCEEDED,
				(boost::format("static_tests must be between 0 and %d") % limits.max_static_tests).str());
	}
	if (draft.random_tests < 0 || draft.random_tests > limits.max_random_tests) {
		return CheckOutcome::with_message(CheckErrorKind::LIMIT_EXCEEDED,
				(boost::format("random_tests must be between 0 and %d") % limits.max_random_tests).str());
	}

	Solution reference;
	reference.environment = draft.solution_environment;
	reference.code = draft.solution_code;
	reference.time_limit = draft.time_limit;
	reference.memory_limit = draft.memory_limit;

	CheckOutcome outcome = checker.check_challenge(draft.evaluator, challenge_id, reference,
													draft.static_tests, draft.random_tests);
	LOG_INFO(log_kind::CHALLENGE, challenge_id, log_fp, "Challenge validated. result: ", outcome.kind);
	return outcome;
}

ChallengeWriteResult JudgeService::create_challenge(const Challenge & draft)
{
	ChallengeWriteResult result;
	result.challenge = draft;
	result.challenge.id = cc::challenge_id_type::generate();
	result.outcome = this->validate_challenge(result.challenge);
	if (!result.outcome.passed()) {
		return result;
	}

	std::unique_ptr<StoreTransaction> trans = store.begin();
	trans->insert_challenge(result.challenge);
	trans->commit();
	LOG_INFO(log_kind::CHALLENGE, result.challenge.id, log_fp, "Challenge created. creator: ", result.challenge.creator);
	return result;
}

ChallengeWriteResult JudgeService::update_challenge(const cc::challenge_id_type & challenge_id, const ChallengePatch & patch)
{
	ChallengeWriteResult result;
	result.challenge = this->find_challenge(challenge_id);
	patch.apply_to(result.challenge);
	result.outcome = this->validate_challenge(result.challenge);
	if (!result.outcome.passed()) {
		return result;
	}

	{
		std::unique_ptr<StoreTransaction> trans = store.begin();
		if (trans->find_challenge(challenge_id) == nullopt) {
			throw NotFoundException("challenge not found: " + challenge_id.to_string());
		}
		trans->update_challenge(result.challenge);
		trans->commit();
	}

	try {
		cache.invalidate(challenge_id.to_string());
	} catch (const CacheException & e) {
		EXCEPT_WARNING(log_kind::CHALLENGE, challenge_id, log_fp, "Invalidate evaluator cache failed.", e);
	}
	LOG_INFO(log_kind::CHALLENGE, challenge_id, log_fp, "Challenge updated.");
	return result;
}

std::vector<Example> JudgeService::list_examples(const cc::challenge_id_type & challenge_id)
{
	Challenge challenge = this->find_challenge(challenge_id);

	Solution reference;
	reference.environment = challenge.solution_environment;
	reference.code = challenge.solution_code;
	reference.time_limit = challenge.time_limit;
	reference.memory_limit = challenge.memory_limit;

	return checker.list_examples(challenge.evaluator, challenge.id, reference);
}

CheckResult JudgeService::test_example(const cc::challenge_id_type & challenge_id, const std::string & example_id,
										const std::string & environment, const std::string & code)
{
	Challenge challenge = this->find_challenge(challenge_id);
	if (!this->environment_exists(environment)) {
		throw EnvironmentNotFoundException(environment);
	}

	Solution solution;
	solution.environment = environment;
	solution.code = code;
	solution.time_limit = challenge.time_limit;
	solution.memory_limit = challenge.memory_limit;

	return checker.test_example(challenge.evaluator, challenge.id, example_id, solution);
}

std::size_t JudgeService::resume_pending()
{
	std::vector<Submission> pending;
	{
		std::unique_ptr<StoreTransaction> trans = store.begin();
		pending = trans->find_pending_submissions();
	}

	for (const Submission & submission : pending) {
		this->schedule(submission);
	}
	LOG_INFO(log_kind::JUDGER, 0, log_fp, "Resumed ", pending.size(), " pending submissions.");
	return pending.size();
}

void JudgeService::shutdown() noexcept
{
	scheduler.shutdown();
}
