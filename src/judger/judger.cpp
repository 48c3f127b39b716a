/*
 * judger.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "logger.hpp"
#include "judger_settings.hpp"
#include "http_api.hpp"
#include "HttpSandbox.hpp"
#include "EvaluatorCache.hpp"
#include "RedisCacheBackend.hpp"
#include "MysqlSubmissionStore.hpp"
#include "RewardService.hpp"
#include "JudgeService.hpp"

#include <kerbal/compatibility/chrono_suffix.hpp>

#include <iostream>
#include <fstream>
#include <iterator>
#include <atomic>
#include <csignal>
#include <thread>

#include <cmdline.h>

#include <boost/filesystem.hpp>

std::ofstream log_fp;

namespace
{
	std::atomic<bool> loop(true); ///< 主工作循环
	redis_conn_pool_type redis_conn_pool;
	mysql_conn_pool_type mysql_conn_pool;
}

/**
 * @brief SIGTERM 信号的处理函数
 * 收到 SIGTERM 后置 loop 为 false, 由 watch_loop 线程停止 HTTP 服务. 已入队的评测任务会在退出前全部完成.
 * @param signum 信号编号
 * @throw 该函数保证不抛出任何异常
 */
void regist_SIGTERM_handler(int signum) noexcept
{
	if (signum == SIGTERM || signum == SIGINT) {
		loop = false;
	}
}

/**
 * @brief 加载配置并打开日志文件
 * @param log_file_path 非空时覆盖配置文件中的日志路径
 */
void load_config(const boost::filesystem::path & config_file, const std::string & log_file_path)
{
	using namespace kerbal::utility::costream;
	const auto & ccerr = costream<std::cerr>(LIGHT_RED);

	extern Settings __settings;

	try {
		__settings.parse(config_file);
	} catch (const std::exception & e) {
		ccerr << "load config failed: " << e.what() << std::endl;
		exit(-1);
	}

	if (!log_file_path.empty()) {
		__settings.runtime.log_file_path = log_file_path;
	}

	try {
		boost::filesystem::path log_dir = settings.get().runtime.log_file_path.parent_path();
		if (!log_dir.empty()) {
			boost::filesystem::create_directories(log_dir);
		}
	} catch (const std::exception & e) {
		ccerr << "make log dir failed: " << e.what() << std::endl;
		exit(-1);
	}

	log_fp.open(settings.get().runtime.log_file_path.string(), std::ios::app);
	if (!log_fp) {
		ccerr << "log file open failed!" << std::endl;
		exit(-1);
	}
}

/**
 * @brief 读入评测程序的库文件
 */
std::vector<SandboxFile> load_evaluator_library()
{
	std::vector<SandboxFile> files;
	const boost::filesystem::path & library_path = settings.get().judge.evaluator.library_path;
	if (library_path.empty()) {
		return files;
	}

	std::ifstream fp(library_path.string(), std::ios::in | std::ios::binary);
	if (!fp) {
		throw std::runtime_error("can't open evaluator library: " + library_path.string());
	}
	std::string content((std::istreambuf_iterator<char>(fp)), std::istreambuf_iterator<char>());
	files.push_back(SandboxFile {library_path.filename().string(), content});
	return files;
}

std::shared_ptr<CacheBackend> make_cache_backend()
{
	const auto & cache_settings = settings.get().cache;
	if (cache_settings.backend == "redis") {
		const auto & redis_settings = settings.get().redis;
		for (int i = 0; i < redis_settings.connections; ++i) {
			add_redis_conn(redis_conn_pool, redis_settings.hostname, redis_settings.port);
		}
		LOG_INFO(log_kind::JUDGER, 0, log_fp, "Redis cache connected: ", redis_settings.hostname, ":", redis_settings.port);
		return std::make_shared<RedisCacheBackend>(redis_conn_pool, redis_settings.hostname, redis_settings.port,
													cache_settings.ttl, cache_settings.key_prefix + ":tag:");
	}
	return std::make_shared<MemoryCacheBackend>(std::chrono::duration_cast<std::chrono::milliseconds>(cache_settings.ttl));
}

/**
 * @brief 等待 loop 被置为 false 后停止 HTTP 服务
 * @throw 该函数保证不抛出任何异常
 */
void watch_loop(httplib::Server & server) noexcept
{
	using namespace kerbal::compatibility::chrono_suffix;
	while (loop) {
		std::this_thread::sleep_for(200_ms);
	}
	LOG_WARNING(log_kind::JUDGER, 0, log_fp,
				"Judger has received the SIGTERM signal and will exit soon after the jobs are all finished!");
	server.stop();
}

/**
 * @brief 评测服务主程序
 * 加载配置; 连接数据库与缓存; 恢复未评测完的提交; 提供 HTTP 服务直至收到 SIGTERM
 * @throw UNKNOWN_EXCEPTION
 */
int main(int argc, char * argv[]) try
{
	cmdline::parser parser;
	parser.add<std::string>("conf", 'c', "Specify configure description file path.", false, "/etc/cc_judger/judger_conf.json");
	parser.add<std::string>("log", 'l', "Specify log file path.", false, "");
	parser.add("version", 'v', "Display the version information.");

	parser.parse_check(argc, argv);

	if (parser.exist("version")) {
		std::cout << "Compiled at: " __DATE__ " " __TIME__ << std::endl;
		return 0;
	}

	load_config(parser.get<std::string>("conf"), parser.get<std::string>("log")); // 提醒: 此函数运行结束以后才可以使用 log 系列宏, 否则 log_fp 没打开
	LOG_INFO(log_kind::JUDGER, 0, log_fp, "Configuration load finished!");

	const Settings & conf = settings.get();

	MysqlConnectOption mysql_option;
	mysql_option.hostname = conf.mysql.hostname;
	mysql_option.username = conf.mysql.username;
	mysql_option.password = conf.mysql.password;
	mysql_option.database = conf.mysql.database;
	mysql_option.port = conf.mysql.port;
	for (int i = 0; i < conf.mysql.connections; ++i) {
		add_mysql_conn(mysql_conn_pool, mysql_option);
	}
	LOG_INFO(log_kind::JUDGER, 0, log_fp, "MySQL connected: ", conf.mysql.hostname, ":", conf.mysql.port);

	EvaluatorRuntime runtime;
	runtime.environment = conf.judge.evaluator.environment;
	runtime.main_file_name = conf.judge.evaluator.main_file_name;
	runtime.library_files = load_evaluator_library();

	HttpSandbox sandbox(conf.sandbox.url, conf.sandbox.timeout);
	MysqlSubmissionStore store(mysql_conn_pool, mysql_option);
	HttpRewardService reward_service(conf.reward.url, conf.reward.token, conf.sandbox.timeout);
	EvaluatorCache cache(make_cache_backend(), conf.cache.key_prefix);

	ChallengeLimits limits;
	limits.max_static_tests = conf.judge.max_static_tests;
	limits.max_random_tests = conf.judge.max_random_tests;

	JudgeService service(sandbox, store, reward_service, cache, runtime, limits, conf.judge.workers);

	try {
		service.resume_pending();
	} catch (const std::exception & e) {
		EXCEPT_FATAL(log_kind::JUDGER, 0, log_fp, "Resume pending submissions failed.", e);
		//DO NOT THROW
	}

	httplib::Server server;
	register_routes(server, service);

	signal(SIGTERM, regist_SIGTERM_handler);
	signal(SIGINT, regist_SIGTERM_handler);

	std::thread watch_thread(watch_loop, std::ref(server));

	LOG_INFO(log_kind::JUDGER, 0, log_fp, "Judger listening on ", conf.runtime.listen_host, ":", conf.runtime.listen_port);
	if (!server.listen(conf.runtime.listen_host.c_str(), conf.runtime.listen_port)) {
		LOG_FATAL(log_kind::JUDGER, 0, log_fp, "Listen failed: ", conf.runtime.listen_host, ":", conf.runtime.listen_port);
		loop = false;
	}

	watch_thread.join();
	service.shutdown();

	LOG_INFO(log_kind::JUDGER, 0, log_fp, "Judger exit.");
	return 0;

} catch (const std::exception & e) {
	EXCEPT_FATAL(log_kind::JUDGER, 0, log_fp, "An uncaught exception caught by main.", e);
	throw;
} catch (...) {
	UNKNOWN_EXCEPT_FATAL(log_kind::JUDGER, 0, log_fp, "An uncaught exception caught by main.");
	throw;
}
