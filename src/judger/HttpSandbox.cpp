/*
 * HttpSandbox.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "HttpSandbox.hpp"
#include "judge_exception.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

static void to_json(nlohmann::json & j, const SandboxFile & file)
{
	j = nlohmann::json {
		{"name", file.name},
		{"content", file.content},
	};
}

namespace
{
	nlohmann::json make_request_body(const BuildRunRequest & request)
	{
		nlohmann::json files = nlohmann::json::array();
		for (const SandboxFile & file : request.files) {
			files.push_back(file);
		}

		nlohmann::json run_limits = nlohmann::json::object();
		if (request.run_limits.time != nullopt) {
			run_limits["time"] = *request.run_limits.time;
		}
		if (request.run_limits.memory != nullopt) {
			run_limits["memory"] = (*request.run_limits.memory).count();
		}

		nlohmann::json run = {
			{"args", request.args},
			{"run_limits", run_limits},
		};
		if (request.stdin_text != nullopt) {
			run["stdin"] = *request.stdin_text;
		}

		return nlohmann::json {
			{"build", {
				{"environment", request.environment},
				{"main_file", request.main_file},
				{"files", files},
			}},
			{"run", run},
		};
	}

	void check_transport(const httplib::Result & res, const char * what)
	{
		if (!res) {
			throw SandboxException(std::string(what) + " failed: " + httplib::to_string(res.error()));
		}
	}

	nlohmann::json parse_body(const httplib::Response & response, const char * what)
	{
		try {
			return nlohmann::json::parse(response.body);
		} catch (const nlohmann::json::exception & e) {
			throw SandboxException(std::string(what) + " returned a malformed body (status "
					+ std::to_string(response.status) + "): " + e.what());
		}
	}
}

HttpSandbox::HttpSandbox(const std::string & base_url, std::chrono::milliseconds timeout) :
		base_url(base_url), timeout(timeout)
{
}

BuildRunResult HttpSandbox::build_and_run(const BuildRunRequest & request)
{
	httplib::Client cli(base_url);
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
	const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
	cli.set_connection_timeout(5, 0);
	cli.set_read_timeout(seconds.count(), micros.count());
	cli.set_write_timeout(seconds.count(), micros.count());

	httplib::Result res = cli.Post("/run", make_request_body(request).dump(), "application/json");
	check_transport(res, "sandbox build_and_run");

	nlohmann::json body = parse_body(*res, "sandbox build_and_run");

	if (res->status == 200) {
		try {
			return body.get<BuildRunResult>();
		} catch (const nlohmann::json::exception & e) {
			throw SandboxException(std::string("unexpected build_and_run response: ") + e.what());
		}
	}

	const std::string error = body.is_object() ? body.value("error", std::string()) : std::string();
	if (error == "environment_not_found") {
		throw EnvironmentNotFoundException(request.environment);
	}
	if (error == "compile_error") {
		PhaseResult build;
		try {
			build = body.at("details").get<PhaseResult>();
		} catch (const nlohmann::json::exception & e) {
			throw SandboxException(std::string("unexpected compile error details: ") + e.what());
		}
		throw CompileErrorException(build);
	}
	throw SandboxException("sandbox build_and_run failed, status: " + std::to_string(res->status) + " body: " + res->body);
}

std::vector<std::string> HttpSandbox::list_environments()
{
	httplib::Client cli(base_url);
	cli.set_connection_timeout(5, 0);

	httplib::Result res = cli.Get("/environments");
	check_transport(res, "sandbox list_environments");
	if (res->status != 200) {
		throw SandboxException("sandbox list_environments failed, status: " + std::to_string(res->status));
	}

	nlohmann::json body = parse_body(*res, "sandbox list_environments");
	if (!body.is_object()) {
		throw SandboxException("unexpected list_environments response: " + res->body);
	}

	std::vector<std::string> environments;
	for (auto it = body.begin(); it != body.end(); ++it) {
		environments.push_back(it.key());
	}
	return environments;
}

ExecutorConfig HttpSandbox::get_config()
{
	httplib::Client cli(base_url);
	cli.set_connection_timeout(5, 0);

	httplib::Result res = cli.Get("/config");
	check_transport(res, "sandbox get_config");
	if (res->status != 200) {
		throw SandboxException("sandbox get_config failed, status: " + std::to_string(res->status));
	}

	nlohmann::json body = parse_body(*res, "sandbox get_config");
	try {
		const auto & run_limits = body.at("run_limits");
		return ExecutorConfig {
			std::chrono::duration_cast<cc::time_in_milliseconds>(std::chrono::seconds(run_limits.at("time").get<std::int64_t>())),
			cc::mem_in_MB(run_limits.at("memory").get<cc::mem_literal>()),
		};
	} catch (const nlohmann::json::exception & e) {
		throw SandboxException(std::string("unexpected get_config response: ") + e.what());
	}
}
