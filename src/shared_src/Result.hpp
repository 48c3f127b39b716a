/*
 * Result.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_RESULT_HPP_
#define SRC_SHARED_SRC_RESULT_HPP_

#include <kerbal/data_struct/optional/optional.hpp>
#include <nlohmann/json.hpp>

#include "db_typedef.hpp"
#include "united_resource.hpp"

#include <iostream>
#include <string>

template <typename Type>
using optional = kerbal::data_struct::optional<Type>;

using kerbal::data_struct::nullopt;

/**
 * @brief 沙箱报告的资源用量
 */
struct ResourceUsage
{
		cc::time_in_milliseconds time; ///< 运行时间
		cc::mem_usage_in_KB_literal memory; ///< 内存峰值, KB

		ResourceUsage() :
				time(0), memory(0)
		{
		}

		ResourceUsage(cc::time_in_milliseconds time, cc::mem_usage_in_KB_literal memory) :
				time(time), memory(memory)
		{
		}
};

/**
 * @brief 沙箱中一个阶段 (编译或运行) 的结果
 */
struct PhaseResult
{
		int status; ///< 退出码
		std::string std_out;
		std::string std_err;
		ResourceUsage resource_usage;

		PhaseResult() :
				status(0)
		{
		}

		PhaseResult(int status, std::string std_out, std::string std_err, ResourceUsage resource_usage) :
				status(status), std_out(std::move(std_out)), std_err(std::move(std_err)), resource_usage(resource_usage)
		{
		}

		friend std::ostream& operator<<(std::ostream& out, const PhaseResult & src);
};

/**
 * @brief 沙箱一次 build_and_run 的结果. 解释型环境没有 build 阶段
 */
struct BuildRunResult
{
		optional<PhaseResult> build;
		PhaseResult run;

		friend std::ostream& operator<<(std::ostream& out, const BuildRunResult & src);
};

/**
 * @brief 一个测试点的评测结果
 */
struct CheckResult
{
		Verdict verdict;
		optional<std::string> reason;
		optional<PhaseResult> compile; ///< 编译阶段, 只要沙箱执行了编译就会附带
		optional<PhaseResult> run; ///< 运行阶段, 编译错误时为空

		CheckResult() :
				verdict(Verdict::OK)
		{
		}

		explicit CheckResult(Verdict verdict) :
				verdict(verdict)
		{
		}

		friend std::ostream& operator<<(std::ostream& out, const CheckResult & src);
};

/**
 * @brief 展示给用户的样例
 */
struct Example
{
		std::string id; ///< 样例的 seed
		std::string input;
		std::string output; ///< 参考解法的输出
		optional<std::string> explanation; ///< 参考解法的 stderr, 非空时才有
};

/**
 * @brief 一次完整校验的结论
 * kind 为 SUCCESS 时表示全部测试点通过, 其余字段按 kind 的不同而有意义:
 * - TESTCASE_FAILED: seed, result
 * - EVALUATOR_FAILED / INVALID_OUTPUT: evaluator_result
 * - ENVIRONMENT_NOT_FOUND / LIMIT_EXCEEDED: message
 */
struct CheckOutcome
{
		CheckErrorKind kind;
		std::string seed;
		CheckResult result;
		optional<BuildRunResult> evaluator_result;
		std::string message;

		CheckOutcome() :
				kind(CheckErrorKind::SUCCESS)
		{
		}

		explicit CheckOutcome(CheckErrorKind kind) :
				kind(kind)
		{
		}

		bool passed() const
		{
			return kind == CheckErrorKind::SUCCESS;
		}

		static CheckOutcome testcase_failed(const std::string & seed, const CheckResult & result);
		static CheckOutcome evaluator_failed(CheckErrorKind kind, const BuildRunResult & evaluator_result);
		static CheckOutcome with_message(CheckErrorKind kind, const std::string & message);

		friend std::ostream& operator<<(std::ostream& out, const CheckOutcome & src);
};

void to_json(nlohmann::json & j, const ResourceUsage & src);
void from_json(const nlohmann::json & j, ResourceUsage & dst);

void to_json(nlohmann::json & j, const PhaseResult & src);
void from_json(const nlohmann::json & j, PhaseResult & dst);

void to_json(nlohmann::json & j, const BuildRunResult & src);
void from_json(const nlohmann::json & j, BuildRunResult & dst);

void to_json(nlohmann::json & j, const CheckResult & src);
void from_json(const nlohmann::json & j, CheckResult & dst);

void to_json(nlohmann::json & j, const Example & src);
void from_json(const nlohmann::json & j, Example & dst);

void to_json(nlohmann::json & j, const CheckOutcome & src);

#endif /* SRC_SHARED_SRC_RESULT_HPP_ */
