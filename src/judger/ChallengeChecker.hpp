/*
 * ChallengeChecker.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_CHALLENGECHECKER_HPP_
#define SRC_JUDGER_CHALLENGECHECKER_HPP_

#include "Evaluator.hpp"
#include "SolutionRunner.hpp"

#include <string>
#include <vector>

/**
 * @brief 一个 seed 完整跑一遍 (generate, run, check) 的结果
 * result 为 OK 时 example 非空
 */
struct CheckedExample
{
		optional<Example> example;
		CheckResult result;
};

void to_json(nlohmann::json & j, const CheckedExample & src);
void from_json(const nlohmann::json & j, CheckedExample & dst);

/**
 * @brief 对一个程序做一次完整的校验. 题目校验 (参考解法) 与提交评测 (选手程序) 共用同一实现
 */
class ChallengeChecker
{
	private:
		Sandbox & sandbox;
		EvaluatorCache & cache;
		const EvaluatorRuntime & runtime;
		SolutionRunner runner;

	public:
		ChallengeChecker(Sandbox & sandbox, EvaluatorCache & cache, const EvaluatorRuntime & runtime);

		Evaluator make_evaluator(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id);

		/**
		 * @brief 测试点的 seed 序列: 样例, 然后 static_tests 个固定 seed, 然后 random_tests 个随机 seed
		 */
		static std::vector<std::string> make_seeds(const std::vector<std::string> & examples,
													const cc::challenge_id_type & challenge_id,
													int static_tests, int random_tests);

		/**
		 * @brief 以 solution 跑一个 seed, 结果按 (评测程序, seed, 程序, 限制) 缓存
		 * @throws EnvironmentNotFoundException
		 * @throws EvaluatorException
		 * @throws SandboxException
		 */
		CheckedExample get_example_checked(Evaluator & evaluator, const Solution & solution, const std::string & seed);

		/**
		 * @brief 依次评测所有 seed, 遇到第一个未通过的 seed 立即返回, 其后的 seed 不会被评测
		 * @return kind 为 SUCCESS 表示全部通过
		 * @throws SandboxException, CacheException 等基础设施故障
		 */
		CheckOutcome check_challenge(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id,
										const Solution & solution, int static_tests, int random_tests);

		/**
		 * @brief 以参考解法的输出作为样例的期望输出
		 * @throws ExampleGenerationFailedException 参考解法未通过某个样例
		 * @throws EvaluatorException
		 */
		std::vector<Example> list_examples(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id,
											const Solution & reference);

		/**
		 * @brief 以选手程序跑一个样例
		 * @throws NotFoundException example_id 不是评测程序声明的样例
		 * @throws EnvironmentNotFoundException
		 * @throws EvaluatorException
		 */
		CheckResult test_example(const std::string & evaluator_source, const cc::challenge_id_type & challenge_id,
									const std::string & example_id, const Solution & solution);
};

#endif /* SRC_JUDGER_CHALLENGECHECKER_HPP_ */
