/*
 * judger_settings.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_JUDGER_SETTINGS_HPP_
#define SRC_JUDGER_JUDGER_SETTINGS_HPP_

#include <chrono>
#include <fstream>
#include <functional>
#include <string>
#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include "db_typedef.hpp"

class Settings
{
	public:

		struct
		{
				boost::filesystem::path log_file_path;
				std::string listen_host;
				int listen_port;
		} runtime;

		struct
		{
				int workers;
				int max_static_tests;
				int max_random_tests;

				struct
				{
						std::string environment;
						std::string main_file_name;
						boost::filesystem::path library_path; ///< 为空表示评测程序不带库文件
				} evaluator;
		} judge;

		struct
		{
				std::string url;
				std::chrono::milliseconds timeout;
		} sandbox;

		struct
		{
				std::string backend; ///< "memory" 或 "redis"
				std::chrono::seconds ttl;
				std::string key_prefix;
		} cache;

		struct
		{
				std::string hostname;
				int port;
				int connections;
		} redis;

		struct
		{
				std::string hostname;
				std::string username;
				std::string password;
				std::string database;
				int port;
				int connections;
		} mysql;

		struct
		{
				std::string url;
				std::string token;
		} reward;

		void parse(const boost::filesystem::path & config_file);
};

extern std::reference_wrapper<const Settings> settings;

#endif /* SRC_JUDGER_JUDGER_SETTINGS_HPP_ */
