/*
 * EvaluatorTest.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <fstream>

#include <boost/test/minimal.hpp>

#include "Evaluator.hpp"
#include "judge_exception.hpp"
#include "../fake/FakeSandbox.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	EvaluatorRuntime make_runtime()
	{
		EvaluatorRuntime runtime;
		runtime.environment = "python";
		runtime.main_file_name = "evaluator.py";
		runtime.library_files.push_back(SandboxFile {"evaluator_lib.py", "def helper(): pass"});
		return runtime;
	}
}

int test_main(int argc, char *argv[])
{
	try {
		const EvaluatorRuntime runtime = make_runtime();

		{
			ScriptedEvaluator script;
			script.examples = {"e1", "e2"};
			FakeSandbox sandbox(scripted_handler(script));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			Evaluator evaluator(sandbox, cache, runtime, "evaluator source", std::string("c1"));

			std::vector<std::string> examples = evaluator.examples();
			BOOST_REQUIRE(examples.size() == 2);
			BOOST_CHECK(examples[0] == "e1");
			BOOST_CHECK(examples[1] == "e2");

			// 评测程序的调用方式
			BOOST_REQUIRE(sandbox.requests.size() == 1);
			const BuildRunRequest & request = sandbox.requests[0];
			BOOST_CHECK(request.environment == "python");
			BOOST_CHECK(request.main_file.name == "evaluator.py");
			BOOST_CHECK(request.main_file.content == "evaluator source");
			BOOST_CHECK(request.files.size() == 1 && request.files[0].name == "evaluator_lib.py");
			BOOST_CHECK(request.args == std::vector<std::string>({"examples"}));
			BOOST_CHECK(request.stdin_text == nullopt);

			EvaluatorInput input = evaluator.generate("e1");
			BOOST_CHECK(input.input == "e1");
			BOOST_CHECK(input.data.at("expected") == "ok-e1");

			CheckResult ok = evaluator.check("e1", "ok-e1", input.data);
			BOOST_CHECK(ok.verdict == Verdict::OK);
			BOOST_CHECK(ok.reason == nullopt);

			CheckResult wrong = evaluator.check("e1", "nope", input.data);
			BOOST_CHECK(wrong.verdict == Verdict::WRONG_ANSWER);
			BOOST_REQUIRE(wrong.reason != nullopt);
			BOOST_CHECK(*wrong.reason == "unexpected output");
			BOOST_CHECK(wrong.run == nullopt);

			// 相同的调用命中缓存, 不再访问沙箱
			const int calls = sandbox.calls;
			BOOST_CHECK(evaluator.examples() == examples);
			BOOST_CHECK(evaluator.generate("e1").input == "e1");
			BOOST_CHECK(evaluator.check("e1", "nope", input.data).verdict == Verdict::WRONG_ANSWER);
			BOOST_CHECK(sandbox.calls == calls);

			// 源码不同的评测程序不共享缓存
			Evaluator other(sandbox, cache, runtime, "evaluator source v2", std::string("c1"));
			other.examples();
			BOOST_CHECK(sandbox.calls == calls + 1);
		}

		{
			ScriptedEvaluator script;
			script.generate_status = 1;
			FakeSandbox sandbox(scripted_handler(script));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			Evaluator evaluator(sandbox, cache, runtime, "failing generate", nullopt);

			try {
				evaluator.generate("e1");
				BOOST_FAIL("EvaluatorFailedException expected");
			} catch (const EvaluatorFailedException & e) {
				BOOST_CHECK(e.kind() == CheckErrorKind::EVALUATOR_FAILED);
				BOOST_CHECK(e.result().run.status == 1);
				BOOST_CHECK(e.result().run.std_err == "generate failed");
			}

			// 失败不会被缓存
			try {
				evaluator.generate("e1");
				BOOST_FAIL("EvaluatorFailedException expected");
			} catch (const EvaluatorFailedException & e) {
			}
			BOOST_CHECK(sandbox.calls == 2);
		}

		{
			ScriptedEvaluator script;
			script.garbage_output = true;
			FakeSandbox sandbox(scripted_handler(script));
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			Evaluator evaluator(sandbox, cache, runtime, "garbage", nullopt);

			try {
				evaluator.examples();
				BOOST_FAIL("InvalidOutputException expected");
			} catch (const InvalidOutputException & e) {
				BOOST_CHECK(e.kind() == CheckErrorKind::INVALID_OUTPUT);
				BOOST_CHECK(e.result().run.std_out == "this is not json");
			}
		}

		{
			// 未知的 verdict
			FakeSandbox sandbox([](const BuildRunRequest &) {
				return make_run_result(0, R"({"verdict": "MAYBE"})");
			});
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			Evaluator evaluator(sandbox, cache, runtime, "unknown verdict", nullopt);
			try {
				evaluator.check("e1", "out", nlohmann::json::object());
				BOOST_FAIL("InvalidOutputException expected");
			} catch (const InvalidOutputException & e) {
			}
		}

		{
			// 格式错误的输出算作错误答案
			FakeSandbox sandbox([](const BuildRunRequest &) {
				return make_run_result(0, R"({"verdict": "INVALID_OUTPUT_FORMAT", "reason": "expected an integer"})");
			});
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			Evaluator evaluator(sandbox, cache, runtime, "format", nullopt);
			CheckResult result = evaluator.check("e1", "abc", nlohmann::json::object());
			BOOST_CHECK(result.verdict == Verdict::WRONG_ANSWER);
			BOOST_CHECK(result.reason != nullopt && *result.reason == "expected an integer");
		}

		{
			// 评测程序编译失败
			FakeSandbox sandbox([](const BuildRunRequest &) -> BuildRunResult {
				throw CompileErrorException(PhaseResult(1, "", "SyntaxError", ResourceUsage()));
			});
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			Evaluator evaluator(sandbox, cache, runtime, "syntax error", nullopt);
			try {
				evaluator.examples();
				BOOST_FAIL("EvaluatorFailedException expected");
			} catch (const EvaluatorFailedException & e) {
				BOOST_CHECK(e.result().build != nullopt);
				BOOST_CHECK((*e.result().build).std_err == "SyntaxError");
			}
		}

		{
			// 评测程序的环境不存在是部署错误
			FakeSandbox sandbox(scripted_handler(ScriptedEvaluator()));
			sandbox.environments = {"rust"};
			EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
			Evaluator evaluator(sandbox, cache, runtime, "no python", nullopt);
			try {
				evaluator.examples();
				BOOST_FAIL("SandboxException expected");
			} catch (const SandboxException & e) {
			}
		}

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
