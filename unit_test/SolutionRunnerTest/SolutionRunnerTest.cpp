/*
 * SolutionRunnerTest.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <fstream>

#include <boost/test/minimal.hpp>

#include "SolutionRunner.hpp"
#include "judge_exception.hpp"
#include "../fake/FakeSandbox.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	Solution make_solution(const std::string & code, const std::string & environment = "rust")
	{
		Solution solution;
		solution.environment = environment;
		solution.code = code;
		solution.time_limit = cc::time_in_milliseconds(1000);
		solution.memory_limit = cc::mem_in_MB(256);
		return solution;
	}
}

int test_main(int argc, char *argv[])
{
	try {
		BOOST_CHECK(SolutionRunner::time_budget_seconds(cc::time_in_milliseconds(1000)) == 2);
		BOOST_CHECK(SolutionRunner::time_budget_seconds(cc::time_in_milliseconds(1500)) == 2);
		BOOST_CHECK(SolutionRunner::time_budget_seconds(cc::time_in_milliseconds(999)) == 1);

		EvaluatorRuntime runtime;
		runtime.environment = "python";
		runtime.main_file_name = "evaluator.py";

		FakeSandbox sandbox(scripted_handler(ScriptedEvaluator()));
		EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
		Evaluator evaluator(sandbox, cache, runtime, "evaluator", nullopt);
		SolutionRunner runner(sandbox);

		EvaluatorInput input = evaluator.generate("e1");

		{
			CheckResult result = runner.run(evaluator, make_solution("echo"), "e1", input);
			BOOST_CHECK(result.verdict == Verdict::OK);
			BOOST_REQUIRE(result.run != nullopt);
			BOOST_CHECK((*result.run).std_out == "ok-e1");

			const BuildRunRequest & request = sandbox.requests.back();
			BOOST_CHECK(request.environment == "rust");
			BOOST_CHECK(request.main_file.name == SolutionRunner::MAIN_FILE_NAME);
			BOOST_CHECK(request.stdin_text != nullopt && *request.stdin_text == "e1");
			BOOST_CHECK(request.run_limits.time != nullopt && *request.run_limits.time == 2);
			BOOST_CHECK(request.run_limits.memory != nullopt && (*request.run_limits.memory).count() == 256);
		}

		{
			CheckResult result = runner.run(evaluator, make_solution("wrong"), "e1", input);
			BOOST_CHECK(result.verdict == Verdict::WRONG_ANSWER);
			BOOST_CHECK(result.reason != nullopt);
			BOOST_CHECK(result.run != nullopt);
		}

		{
			CheckResult result = runner.run(evaluator, make_solution("crash"), "e1", input);
			BOOST_CHECK(result.verdict == Verdict::RUNTIME_ERROR);
			BOOST_REQUIRE(result.run != nullopt);
			BOOST_CHECK((*result.run).std_err == "boom");
		}

		BOOST_CHECK(runner.run(evaluator, make_solution("silent"), "e1", input).verdict == Verdict::NO_OUTPUT);
		BOOST_CHECK(runner.run(evaluator, make_solution("slow"), "e1", input).verdict == Verdict::TIME_LIMIT_EXCEEDED);

		{
			// 256 MB 限制, 峰值 300000 KB
			CheckResult result = runner.run(evaluator, make_solution("hog"), "e1", input);
			BOOST_CHECK(result.verdict == Verdict::MEMORY_LIMIT_EXCEEDED);
			BOOST_REQUIRE(result.run != nullopt);
			BOOST_CHECK((*result.run).std_err == "hog");
			BOOST_CHECK((*result.run).resource_usage.time == cc::time_in_milliseconds(12));
			BOOST_CHECK((*result.run).resource_usage.memory == 300000);
		}

		{
			CheckResult result = runner.run(evaluator, make_solution("broken"), "e1", input);
			BOOST_CHECK(result.verdict == Verdict::COMPILATION_ERROR);
			BOOST_REQUIRE(result.compile != nullopt);
			BOOST_CHECK((*result.compile).std_err == "syntax error");
			BOOST_CHECK(result.run == nullopt);
		}

		{
			// 没有限制时不判超时与超内存
			Solution unlimited = make_solution("hog");
			unlimited.time_limit = nullopt;
			unlimited.memory_limit = nullopt;
			BOOST_CHECK(runner.run(evaluator, unlimited, "e1", input).verdict == Verdict::OK);
			BOOST_CHECK(sandbox.requests.back().run_limits.time == nullopt);
		}

		{
			// 运行失败优先于超时
			FakeSandbox crash_sandbox([](const BuildRunRequest &) {
				return make_run_result(137, "", "killed", cc::time_in_milliseconds(3000), 500000);
			});
			SolutionRunner crash_runner(crash_sandbox);
			BOOST_CHECK(crash_runner.run(evaluator, make_solution("anything"), "e1", input).verdict == Verdict::RUNTIME_ERROR);
		}

		try {
			runner.run(evaluator, make_solution("echo", "cobol"), "e1", input);
			BOOST_FAIL("EnvironmentNotFoundException expected");
		} catch (const EnvironmentNotFoundException & e) {
			BOOST_CHECK(e.environment() == "cobol");
		}

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
