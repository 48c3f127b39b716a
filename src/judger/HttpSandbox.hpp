/*
 * HttpSandbox.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_HTTPSANDBOX_HPP_
#define SRC_JUDGER_HTTPSANDBOX_HPP_

#include "Sandbox.hpp"

#include <chrono>
#include <string>

/**
 * @brief 通过 HTTP/JSON 调用沙箱服务
 *
 * - POST /run : build_and_run
 * - GET /environments : 环境列表, 形如 {"python": {...}, "rust": {...}}
 * - GET /config : {"run_limits": {"time": 秒, "memory": MB}}
 *
 * 错误响应体形如 {"error": "environment_not_found"} 或 {"error": "compile_error", "details": PhaseResult}
 */
class HttpSandbox : public Sandbox
{
	private:
		std::string base_url;
		std::chrono::milliseconds timeout;

	public:
		HttpSandbox(const std::string & base_url, std::chrono::milliseconds timeout);

		virtual BuildRunResult build_and_run(const BuildRunRequest & request) override;

		virtual std::vector<std::string> list_environments() override;

		virtual ExecutorConfig get_config() override;
};

#endif /* SRC_JUDGER_HTTPSANDBOX_HPP_ */
