/*
 * SolutionRunner.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "SolutionRunner.hpp"
#include "judge_exception.hpp"

SolutionRunner::SolutionRunner(Sandbox & sandbox) :
		sandbox(sandbox)
{
}

int SolutionRunner::time_budget_seconds(cc::time_in_milliseconds time_limit)
{
	return static_cast<int>(time_limit.count() / 1000 + 1);
}

CheckResult SolutionRunner::run(Evaluator & evaluator, const Solution & solution, const std::string & seed, const EvaluatorInput & input)
{
	BuildRunRequest request;
	request.environment = solution.environment;
	request.main_file = SandboxFile {MAIN_FILE_NAME, solution.code};
	request.stdin_text = input.input;
	if (solution.time_limit != nullopt) {
		request.run_limits.time = time_budget_seconds(*solution.time_limit);
	}
	request.run_limits.memory = solution.memory_limit;

	BuildRunResult result;
	try {
		result = sandbox.build_and_run(request);
	} catch (const CompileErrorException & e) {
		CheckResult compile_error(Verdict::COMPILATION_ERROR);
		compile_error.compile = e.build();
		return compile_error;
	}

	CheckResult check_result;
	check_result.compile = result.build;
	check_result.run = result.run;

	const PhaseResult & run = result.run;

	if (run.status != 0) {
		check_result.verdict = Verdict::RUNTIME_ERROR;
		return check_result;
	}

	if (run.std_out.empty()) {
		check_result.verdict = Verdict::NO_OUTPUT;
		return check_result;
	}

	if (solution.time_limit != nullopt && run.resource_usage.time > *solution.time_limit) {
		check_result.verdict = Verdict::TIME_LIMIT_EXCEEDED;
		return check_result;
	}

	if (solution.memory_limit != nullopt && run.resource_usage.memory / 1024 > (*solution.memory_limit).count()) {
		check_result.verdict = Verdict::MEMORY_LIMIT_EXCEEDED;
		return check_result;
	}

	CheckResult verdict = evaluator.check(seed, run.std_out, input.data);
	check_result.verdict = verdict.verdict;
	check_result.reason = verdict.reason;
	return check_result;
}
