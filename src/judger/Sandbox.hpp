/*
 * Sandbox.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_SANDBOX_HPP_
#define SRC_JUDGER_SANDBOX_HPP_

#include "Result.hpp"
#include "db_typedef.hpp"

#include <string>
#include <vector>

struct SandboxFile
{
		std::string name;
		std::string content;
};

/**
 * @brief 运行阶段的资源限制, 未设置的项由沙箱使用其默认值
 */
struct RunLimits
{
		optional<int> time; ///< 整秒
		optional<cc::mem_in_MB> memory;
};

/**
 * @brief 沙箱 build_and_run 的请求
 */
struct BuildRunRequest
{
		std::string environment; ///< 运行环境, 例如 python, rust
		SandboxFile main_file;
		std::vector<SandboxFile> files; ///< 与主文件一同放入工作目录的其他文件
		std::vector<std::string> args; ///< 命令行参数
		optional<std::string> stdin_text;
		RunLimits run_limits;
};

/**
 * @brief 沙箱允许的最大资源限制
 */
struct ExecutorConfig
{
		cc::time_in_milliseconds max_time_limit;
		cc::mem_in_MB max_memory_limit;
};

/**
 * @brief 外部沙箱服务的接口. 沙箱本身不属于本系统, 实现可以是远程服务也可以是测试替身
 * 实现必须可以被多个评测线程同时调用
 */
class Sandbox
{
	public:
		virtual ~Sandbox() noexcept = default;

		/**
		 * @brief 构建并运行一个程序
		 * @return 构建阶段 (若有) 与运行阶段的结果
		 * @throws EnvironmentNotFoundException 沙箱不提供该环境
		 * @throws CompileErrorException 构建阶段失败
		 * @throws SandboxException 通信失败或响应无法识别
		 */
		virtual BuildRunResult build_and_run(const BuildRunRequest & request) = 0;

		/**
		 * @brief 沙箱提供的所有运行环境的名称
		 * @throws SandboxException
		 */
		virtual std::vector<std::string> list_environments() = 0;

		/**
		 * @throws SandboxException
		 */
		virtual ExecutorConfig get_config() = 0;
};

#endif /* SRC_JUDGER_SANDBOX_HPP_ */
