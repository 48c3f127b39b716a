/*
 * ChallengeCheckerTest.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <fstream>

#include <boost/test/minimal.hpp>

#include "ChallengeChecker.hpp"
#include "judge_exception.hpp"
#include "../fake/FakeSandbox.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	Solution make_solution(const std::string & code)
	{
		Solution solution;
		solution.environment = "rust";
		solution.code = code;
		solution.time_limit = cc::time_in_milliseconds(1000);
		solution.memory_limit = cc::mem_in_MB(256);
		return solution;
	}

	EvaluatorRuntime make_runtime()
	{
		EvaluatorRuntime runtime;
		runtime.environment = "python";
		runtime.main_file_name = "evaluator.py";
		return runtime;
	}

	/**
	 * @brief 选手程序被运行时的输入, 即 seed
	 */
	std::vector<std::string> solution_inputs(FakeSandbox & sandbox)
	{
		std::vector<std::string> inputs;
		for (const BuildRunRequest & request : sandbox.requests) {
			if (request.main_file.name == SolutionRunner::MAIN_FILE_NAME) {
				inputs.push_back(*request.stdin_text);
			}
		}
		return inputs;
	}
}

int test_main(int argc, char *argv[])
{
	try {
		const EvaluatorRuntime runtime = make_runtime();
		const cc::challenge_id_type challenge_id = cc::challenge_id_type::generate();

		{
			std::vector<std::string> seeds = ChallengeChecker::make_seeds({"e1", "e2"}, challenge_id, 2, 3);
			BOOST_REQUIRE(seeds.size() == 7);
			BOOST_CHECK(seeds[0] == "e1");
			BOOST_CHECK(seeds[1] == "e2");
			BOOST_CHECK(seeds[2] == "_static_0_" + challenge_id.to_string());
			BOOST_CHECK(seeds[3] == "_static_1_" + challenge_id.to_string());
			BOOST_CHECK(seeds[4] != seeds[5] && seeds[5] != seeds[6]);

			std::vector<std::string> again = ChallengeChecker::make_seeds({"e1", "e2"}, challenge_id, 2, 3);
			BOOST_CHECK(again[3] == seeds[3]);
			BOOST_CHECK(again[4] != seeds[4]);
		}

		{
			// 一个样例加一个固定 seed, 参考解法全部通过
			FakeSandbox sandbox(scripted_handler(ScriptedEvaluator()));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			ChallengeChecker checker(sandbox, cache, runtime);

			CheckOutcome outcome = checker.check_challenge("evaluator", challenge_id, make_solution("echo"), 1, 0);
			BOOST_CHECK(outcome.passed());
			BOOST_CHECK(solution_inputs(sandbox) == std::vector<std::string>({"e1", "_static_0_" + challenge_id.to_string()}));

			// 再次校验全部命中缓存
			const int calls = sandbox.calls;
			BOOST_CHECK(checker.check_challenge("evaluator", challenge_id, make_solution("echo"), 1, 0).passed());
			BOOST_CHECK(sandbox.calls == calls);
		}

		{
			// 第一个未通过的 seed 之后不再评测
			ScriptedEvaluator script;
			script.examples = {"e1", "e2", "e3"};
			FakeSandbox::handler_type scripted = scripted_handler(script);
			FakeSandbox sandbox([scripted](const BuildRunRequest & request) {
				if (request.main_file.name == SolutionRunner::MAIN_FILE_NAME && *request.stdin_text == "e2") {
					return make_run_result(0, "nope");
				}
				return scripted(request);
			});
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			ChallengeChecker checker(sandbox, cache, runtime);

			CheckOutcome outcome = checker.check_challenge("evaluator", challenge_id, make_solution("echo"), 5, 5);
			BOOST_CHECK(outcome.kind == CheckErrorKind::TESTCASE_FAILED);
			BOOST_CHECK(outcome.seed == "e2");
			BOOST_CHECK(outcome.result.verdict == Verdict::WRONG_ANSWER);
			BOOST_CHECK(solution_inputs(sandbox) == std::vector<std::string>({"e1", "e2"}));
		}

		{
			ScriptedEvaluator script;
			script.examples.clear();
			FakeSandbox sandbox(scripted_handler(script));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			ChallengeChecker checker(sandbox, cache, runtime);

			CheckOutcome outcome = checker.check_challenge("evaluator", challenge_id, make_solution("echo"), 3, 3);
			BOOST_CHECK(outcome.kind == CheckErrorKind::NO_EXAMPLES);
			BOOST_CHECK(solution_inputs(sandbox).empty());
		}

		{
			ScriptedEvaluator script;
			script.generate_status = 1;
			FakeSandbox sandbox(scripted_handler(script));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			ChallengeChecker checker(sandbox, cache, runtime);

			CheckOutcome outcome = checker.check_challenge("evaluator", challenge_id, make_solution("echo"), 1, 0);
			BOOST_CHECK(outcome.kind == CheckErrorKind::EVALUATOR_FAILED);
			BOOST_REQUIRE(outcome.evaluator_result != nullopt);
			BOOST_CHECK((*outcome.evaluator_result).run.status == 1);

			// 列出样例时评测程序故障以异常报告
			try {
				checker.list_examples("evaluator", challenge_id, make_solution("echo"));
				BOOST_FAIL("EvaluatorFailedException expected");
			} catch (const EvaluatorFailedException & e) {
			}
		}

		{
			FakeSandbox sandbox(scripted_handler(ScriptedEvaluator()));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			ChallengeChecker checker(sandbox, cache, runtime);

			Solution solution = make_solution("echo");
			solution.environment = "cobol";
			CheckOutcome outcome = checker.check_challenge("evaluator", challenge_id, solution, 1, 0);
			BOOST_CHECK(outcome.kind == CheckErrorKind::ENVIRONMENT_NOT_FOUND);
			BOOST_CHECK(outcome.message == "cobol");
		}

		{
			ScriptedEvaluator script;
			script.examples = {"e1", "e2"};
			FakeSandbox sandbox(scripted_handler(script));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			ChallengeChecker checker(sandbox, cache, runtime);

			std::vector<Example> examples = checker.list_examples("evaluator", challenge_id, make_solution("echo"));
			BOOST_REQUIRE(examples.size() == 2);
			BOOST_CHECK(examples[0].id == "e1");
			BOOST_CHECK(examples[0].input == "e1");
			BOOST_CHECK(examples[0].output == "ok-e1");
			BOOST_CHECK(examples[0].explanation == nullopt);

			try {
				checker.list_examples("evaluator", challenge_id, make_solution("wrong"));
				BOOST_FAIL("ExampleGenerationFailedException expected");
			} catch (const ExampleGenerationFailedException & e) {
				BOOST_CHECK(e.result().verdict == Verdict::WRONG_ANSWER);
			}

			BOOST_CHECK(checker.test_example("evaluator", challenge_id, "e2", make_solution("echo")).verdict == Verdict::OK);
			BOOST_CHECK(checker.test_example("evaluator", challenge_id, "e2", make_solution("crash")).verdict == Verdict::RUNTIME_ERROR);
			try {
				checker.test_example("evaluator", challenge_id, "e9", make_solution("echo"));
				BOOST_FAIL("NotFoundException expected");
			} catch (const NotFoundException & e) {
			}
		}

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
