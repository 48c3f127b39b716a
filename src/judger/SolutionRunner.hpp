/*
 * SolutionRunner.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_SOLUTIONRUNNER_HPP_
#define SRC_JUDGER_SOLUTIONRUNNER_HPP_

#include "Evaluator.hpp"
#include "Sandbox.hpp"

#include <string>

/**
 * @brief 待评测的程序及其资源限制
 */
struct Solution
{
		std::string environment;
		std::string code;
		optional<cc::time_in_milliseconds> time_limit;
		optional<cc::mem_in_MB> memory_limit;
};

/**
 * @brief 在沙箱中运行选手程序并给出一个测试点的结论
 *
 * 沙箱返回后依次判断:
 * 编译错误 -> 退出码非 0 -> stdout 为空 -> 超时 -> 超内存 -> 交给评测程序 check.
 * 前面的条件一旦满足就不再往后判断. 编译与运行阶段的结果总是附在结论中.
 */
class SolutionRunner
{
	private:
		Sandbox & sandbox;

	public:
		static constexpr const char * MAIN_FILE_NAME = "code";

		explicit SolutionRunner(Sandbox & sandbox);

		/**
		 * @brief 交给沙箱的时间预算: 严格大于毫秒限制的最小整秒数
		 * 精确的超时判定由本类按毫秒进行
		 */
		static int time_budget_seconds(cc::time_in_milliseconds time_limit);

		/**
		 * @throws EnvironmentNotFoundException 沙箱不提供 solution 的环境
		 * @throws EvaluatorException 评测程序 check 失败
		 * @throws SandboxException
		 */
		CheckResult run(Evaluator & evaluator, const Solution & solution, const std::string & seed, const EvaluatorInput & input);
};

#endif /* SRC_JUDGER_SOLUTIONRUNNER_HPP_ */
