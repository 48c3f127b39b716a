/*
 * judger_settings.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <stdexcept>
#include "judger_settings.hpp"

void Settings::parse(const boost::filesystem::path & config_file)
{
	nlohmann::json json_obj;
	{
		std::ifstream config_file_stream {config_file.string()};
		if (!config_file_stream) {
			throw std::runtime_error("can't open config file: " + config_file.string());
		}
		config_file_stream >> json_obj;
	}

	{
		const auto & runtime_node = json_obj.at("runtime");
		runtime.log_file_path = runtime_node.at("log_file_path").get<std::string>();
		runtime.listen_host = runtime_node.value("listen_host", "0.0.0.0");
		runtime.listen_port = runtime_node.at("listen_port");
	}

	{
		const auto & judge_node = json_obj.at("judge");
		judge.workers = judge_node.at("workers");
		judge.max_static_tests = judge_node.at("max_static_tests");
		judge.max_random_tests = judge_node.at("max_random_tests");
		if (judge.workers < 1) {
			throw std::invalid_argument("judge.workers must be positive");
		}

		{
			const auto & evaluator_node = judge_node.at("evaluator");
			judge.evaluator.environment = evaluator_node.at("environment").get<std::string>();
			judge.evaluator.main_file_name = evaluator_node.value("main_file_name", "evaluator.py");
			judge.evaluator.library_path = evaluator_node.value("library_path", "");
		}
	}

	{
		const auto & sandbox_node = json_obj.at("sandbox");
		sandbox.url = sandbox_node.at("url").get<std::string>();
		sandbox.timeout = std::chrono::milliseconds(sandbox_node.value("timeout", 60000));
	}

	{
		const auto & cache_node = json_obj.at("cache");
		cache.backend = cache_node.value("backend", "memory");
		cache.ttl = std::chrono::seconds(cache_node.value("ttl", 0));
		cache.key_prefix = cache_node.value("key_prefix", "cc_judger");
		if (cache.backend != "memory" && cache.backend != "redis") {
			throw std::invalid_argument("unknown cache backend: " + cache.backend);
		}
	}

	if (cache.backend == "redis") {
		const auto & redis_node = json_obj.at("redis");
		redis.hostname = redis_node.at("hostname").get<std::string>();
		redis.port = redis_node.at("port");
		redis.connections = redis_node.value("connections", 4);
	}

	{
		const auto & mysql_node = json_obj.at("mysql");
		mysql.hostname = mysql_node.at("hostname").get<std::string>();
		mysql.username = mysql_node.at("username").get<std::string>();
		mysql.password = mysql_node.at("password").get<std::string>();
		mysql.database = mysql_node.at("database").get<std::string>();
		mysql.port = mysql_node.value("port", 3306);
		mysql.connections = mysql_node.value("connections", judge.workers + 4);
	}

	{
		const auto & reward_node = json_obj.at("reward");
		reward.url = reward_node.at("url").get<std::string>();
		reward.token = reward_node.value("token", "");
	}
}

Settings __settings;

std::reference_wrapper<const Settings> settings(__settings);
