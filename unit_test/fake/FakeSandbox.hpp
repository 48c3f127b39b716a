/*
 * FakeSandbox.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef UNIT_TEST_FAKE_FAKESANDBOX_HPP_
#define UNIT_TEST_FAKE_FAKESANDBOX_HPP_

#include "Sandbox.hpp"
#include "judge_exception.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief 由测试脚本决定每次 build_and_run 的结果的沙箱
 * 记录调用次数, 所有请求, 以及同时进行的调用数的峰值
 */
class FakeSandbox : public Sandbox
{
	public:
		typedef std::function<BuildRunResult(const BuildRunRequest &)> handler_type;

		handler_type handler;
		std::function<void()> on_list_environments; ///< 非空时在每次查询环境列表时调用
		std::vector<std::string> environments {"python", "rust"};
		ExecutorConfig config {cc::time_in_milliseconds(10000), cc::mem_in_MB(1024)};

		std::atomic<int> calls {0};
		std::atomic<int> environment_queries {0};
		std::atomic<int> in_flight {0};
		std::atomic<int> max_in_flight {0};

		std::mutex mtx;
		std::vector<BuildRunRequest> requests;

		explicit FakeSandbox(handler_type handler) :
				handler(std::move(handler))
		{
		}

		virtual BuildRunResult build_and_run(const BuildRunRequest & request) override
		{
			++calls;
			{
				std::lock_guard<std::mutex> lck(mtx);
				requests.push_back(request);
			}
			if (std::find(environments.begin(), environments.end(), request.environment) == environments.end()) {
				throw EnvironmentNotFoundException(request.environment);
			}

			int now = ++in_flight;
			int seen = max_in_flight.load();
			while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
			}

			try {
				BuildRunResult result = handler(request);
				--in_flight;
				return result;
			} catch (...) {
				--in_flight;
				throw;
			}
		}

		virtual std::vector<std::string> list_environments() override
		{
			++environment_queries;
			if (on_list_environments) {
				on_list_environments();
			}
			return environments;
		}

		virtual ExecutorConfig get_config() override
		{
			return config;
		}

		/**
		 * @brief 以 main_file 名称区分出的调用次数
		 */
		int count_requests(const std::string & main_file_name)
		{
			std::lock_guard<std::mutex> lck(mtx);
			return std::count_if(requests.begin(), requests.end(), [&](const BuildRunRequest & request) {
				return request.main_file.name == main_file_name;
			});
		}
};

inline BuildRunResult make_run_result(int status, const std::string & std_out, const std::string & std_err = "",
										cc::time_in_milliseconds time = cc::time_in_milliseconds(10), cc::mem_usage_in_KB_literal memory = 1024)
{
	BuildRunResult result;
	result.run = PhaseResult(status, std_out, std_err, ResourceUsage(time, memory));
	return result;
}

/**
 * @brief 测试中的评测程序的行为
 *
 * examples 输出 examples; generate 对 seed 生成输入 seed, 期望输出 "ok-" + seed;
 * check 比较选手输出与期望输出.
 */
struct ScriptedEvaluator
{
		std::string main_file_name = "evaluator.py";
		std::vector<std::string> examples {"e1"};
		int examples_status = 0;
		int generate_status = 0;
		int check_status = 0;
		bool garbage_output = false;
};

/**
 * @brief 按选手代码决定运行结果:
 * - echo: 输出 "ok-" + 标准输入
 * - wrong: 输出错误答案
 * - crash: 退出码 1
 * - silent: 无输出
 * - slow: 用时 5000 ms
 * - hog: 内存 300000 KB
 * - broken: 编译错误
 * - wait: 睡眠 solution_delay 后同 echo
 */
inline FakeSandbox::handler_type scripted_handler(const ScriptedEvaluator & script,
													std::chrono::milliseconds solution_delay = std::chrono::milliseconds(0))
{
	return [script, solution_delay](const BuildRunRequest & request) -> BuildRunResult {
		if (request.main_file.name == script.main_file_name) {
			if (script.garbage_output) {
				return make_run_result(0, "this is not json");
			}
			const std::string & operation = request.args.at(0);
			if (operation == "examples") {
				if (script.examples_status != 0) {
					return make_run_result(script.examples_status, "", "examples failed");
				}
				return make_run_result(0, nlohmann::json(script.examples).dump());
			}
			if (operation == "generate") {
				if (script.generate_status != 0) {
					return make_run_result(script.generate_status, "", "generate failed");
				}
				const std::string & seed = request.args.at(1);
				nlohmann::json input = {
					{"input", seed},
					{"data", {{"expected", "ok-" + seed}}},
				};
				return make_run_result(0, input.dump());
			}
			if (script.check_status != 0) {
				return make_run_result(script.check_status, "", "check failed");
			}
			nlohmann::json stdin_json = nlohmann::json::parse(*request.stdin_text);
			bool ok = stdin_json.at("output").get<std::string>() == stdin_json.at("data").at("expected").get<std::string>();
			nlohmann::json verdict = ok
					? nlohmann::json {{"verdict", "OK"}}
					: nlohmann::json {{"verdict", "WRONG_ANSWER"}, {"reason", "unexpected output"}};
			return make_run_result(0, verdict.dump());
		}

		const std::string & code = request.main_file.content;
		const std::string input = request.stdin_text != nullopt ? *request.stdin_text : std::string();
		if (code == "wrong") {
			return make_run_result(0, "nope");
		}
		if (code == "crash") {
			return make_run_result(1, "", "boom");
		}
		if (code == "silent") {
			return make_run_result(0, "");
		}
		if (code == "slow") {
			return make_run_result(0, "ok-" + input, "", cc::time_in_milliseconds(5000));
		}
		if (code == "hog") {
			return make_run_result(0, "ok-" + input, "hog", cc::time_in_milliseconds(12), 300000);
		}
		if (code == "broken") {
			throw CompileErrorException(PhaseResult(1, "", "syntax error", ResourceUsage()));
		}
		if (code == "wait") {
			std::this_thread::sleep_for(solution_delay);
		}
		return make_run_result(0, "ok-" + input);
	};
}

#endif /* UNIT_TEST_FAKE_FAKESANDBOX_HPP_ */
