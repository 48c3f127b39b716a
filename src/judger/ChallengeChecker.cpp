/*
 * ChallengeChecker.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "ChallengeChecker.hpp"
#include "judge_exception.hpp"
#include "logger.hpp"

#include <boost/format.hpp>
#include <algorithm>

extern std::ofstream log_fp;

void to_json(nlohmann::json & j, const CheckedExample & src)
{
	j = nlohmann::json::object();
	if (src.example != nullopt) {
		j["example"] = *src.example;
	} else {
		j["example"] = nullptr;
	}
	j["result"] = src.result;
}

void from_json(const nlohmann::json & j, CheckedExample & dst)
{
	const auto & example = j.at("example");
	if (example.is_null()) {
		dst.example = nullopt;
	} else {
		dst.example = example.get<Example>();
	}
	dst.result = j.at("result").get<CheckResult>();
}

ChallengeChecker::ChallengeChecker(Sandbox & sandbox, EvaluatorCache & cache, const EvaluatorRuntime & runtime) :
		sandbox(sandbox), cache(cache), runtime(runtime), runner(sandbox)
{
}

Evaluator ChallengeChecker::make_evaluator(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id)
{
	return Evaluator(sandbox, cache, runtime, evaluator_source, challenge_id.to_string());
}

std::vector<std::string> ChallengeChecker::make_seeds(const std::vector<std::string> & examples,
														const cc::challenge_id_type & challenge_id,
														int static_tests, int random_tests)
{
	static boost::format static_seed_tmpl("_static_%d_%s");

	std::vector<std::string> seeds(examples);
	seeds.reserve(examples.size() + std::max(static_tests, 0) + std::max(random_tests, 0));
	for (int i = 0; i < static_tests; ++i) {
		seeds.push_back((boost::format(static_seed_tmpl) % i % challenge_id).str());
	}
	for (int i = 0; i < random_tests; ++i) {
		seeds.push_back(boost::uuids::to_string(boost::uuids::random_generator()()));
	}
	return seeds;
}

CheckedExample ChallengeChecker::get_example_checked(Evaluator & evaluator, const Solution & solution, const std::string & seed)
{
	nlohmann::json args = {
		seed,
		solution.environment,
		solution.code,
		solution.time_limit != nullopt ? nlohmann::json((*solution.time_limit).count()) : nlohmann::json(nullptr),
		solution.memory_limit != nullopt ? nlohmann::json((*solution.memory_limit).count()) : nlohmann::json(nullptr),
	};

	return evaluator.cached<CheckedExample>("checked_example", args, [&]() {
		EvaluatorInput input = evaluator.generate(seed);

		CheckedExample checked;
		checked.result = runner.run(evaluator, solution, seed, input);
		if (checked.result.verdict == Verdict::OK) {
			Example example;
			example.id = seed;
			example.input = input.input;
			example.output = (*checked.result.run).std_out;
			if (!(*checked.result.run).std_err.empty()) {
				example.explanation = (*checked.result.run).std_err;
			}
			checked.example = example;
		}
		return checked;
	});
}

CheckOutcome ChallengeChecker::check_challenge(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id,
												const Solution & solution, int static_tests, int random_tests)
{
	PROFILE_HEAD

	Evaluator evaluator = this->make_evaluator(evaluator_source, challenge_id);

	std::vector<std::string> examples;
	try {
		examples = evaluator.examples();
	} catch (const EvaluatorException & e) {
		EXCEPT_WARNING(log_kind::CHALLENGE, challenge_id, log_fp, "Evaluator failed to list examples.", e);
		return CheckOutcome::evaluator_failed(e.kind(), e.result());
	}

	if (examples.empty()) {
		return CheckOutcome(CheckErrorKind::NO_EXAMPLES);
	}

	for (const std::string & seed : make_seeds(examples, challenge_id, static_tests, random_tests)) {
		CheckedExample checked;
		try {
			checked = this->get_example_checked(evaluator, solution, seed);
		} catch (const EnvironmentNotFoundException & e) {
			return CheckOutcome::with_message(CheckErrorKind::ENVIRONMENT_NOT_FOUND, e.environment());
		} catch (const EvaluatorException & e) {
			EXCEPT_WARNING(log_kind::CHALLENGE, challenge_id, log_fp, "Evaluator failed.", e, " seed: ", seed);
			return CheckOutcome::evaluator_failed(e.kind(), e.result());
		}

		LOG_DEBUG(log_kind::CHALLENGE, challenge_id, log_fp, "seed: ", seed, " ", checked.result);

		if (checked.result.verdict != Verdict::OK) {
			return CheckOutcome::testcase_failed(seed, checked.result);
		}
	}

	PROFILE_TAIL(log_kind::CHALLENGE, challenge_id, log_fp);
	return CheckOutcome();
}

std::vector<Example> ChallengeChecker::list_examples(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id,
														const Solution & reference)
{
	Evaluator evaluator = this->make_evaluator(evaluator_source, challenge_id);

	std::vector<Example> examples;
	for (const std::string & seed : evaluator.examples()) {
		CheckedExample checked = this->get_example_checked(evaluator, reference, seed);
		if (checked.example == nullopt) {
			throw ExampleGenerationFailedException(seed, checked.result);
		}
		examples.push_back(*checked.example);
	}
	return examples;
}

CheckResult ChallengeChecker::test_example(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id,
											const std::string & example_id, const Solution & solution)
{
	Evaluator evaluator = this->make_evaluator(evaluator_source, challenge_id);

	std::vector<std::string> examples = evaluator.examples();
	if (std::find(examples.begin(), examples.end(), example_id) == examples.end()) {
		throw NotFoundException("example not found: " + example_id);
	}

	return this->get_example_checked(evaluator, solution, example_id).result;
}
