/*
 * Evaluator.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_EVALUATOR_HPP_
#define SRC_JUDGER_EVALUATOR_HPP_

#include "Sandbox.hpp"
#include "EvaluatorCache.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

/**
 * @brief 评测程序为一个 seed 生成的测试输入
 */
struct EvaluatorInput
{
		std::string input; ///< 交给选手程序的标准输入
		nlohmann::json data; ///< 只有评测程序自己能看到的私有数据, check 时原样传回
};

void to_json(nlohmann::json & j, const EvaluatorInput & src);
void from_json(const nlohmann::json & j, EvaluatorInput & dst);

/**
 * @brief 评测程序的运行方式
 */
struct EvaluatorRuntime
{
		std::string environment; ///< 评测程序使用的沙箱环境, 例如 python
		std::string main_file_name; ///< 评测程序源码的文件名
		std::vector<SandboxFile> library_files; ///< 与评测程序一同放入的库文件
};

/**
 * @brief 评测程序的适配器, 对外只提供 examples, generate, check 三个操作
 *
 * 每个操作都让沙箱以命令行参数的形式运行一次评测程序并把 stdout 解析为 json, 结果均经过缓存.
 * 评测程序非零退出抛出 EvaluatorFailedException, 输出格式不符抛出 InvalidOutputException.
 */
class Evaluator
{
	private:
		Sandbox & sandbox;
		EvaluatorCache & cache;
		const EvaluatorRuntime & runtime;
		std::string source;
		optional<std::string> tag;

		BuildRunResult run(const std::vector<std::string> & args, const optional<std::string> & stdin_text);

		template <typename Type>
		Type parse_output(const BuildRunResult & result);

	public:
		/**
		 * @param source 评测程序源码
		 * @param tag 缓存条目归属的 tag, 一般为题目 id; 校验尚未入库的题目时为空
		 */
		Evaluator(Sandbox & sandbox, EvaluatorCache & cache, const EvaluatorRuntime & runtime,
					const std::string & source, const optional<std::string> & tag);

		/**
		 * @brief 评测程序声明的样例 seed, 按声明顺序
		 */
		std::vector<std::string> examples();

		EvaluatorInput generate(const std::string & seed);

		/**
		 * @brief 判定选手输出
		 * @return verdict 只会是 OK 或 WRONG_ANSWER, 不带运行阶段信息
		 */
		CheckResult check(const std::string & seed, const std::string & output, const nlohmann::json & data);

		/**
		 * @brief 以本评测程序的源码与 operation, args 为键, 经缓存计算 compute
		 */
		template <typename Type, typename Compute>
		Type cached(const std::string & operation, const nlohmann::json & args, Compute && compute)
		{
			nlohmann::json parts = nlohmann::json::array({source});
			for (const auto & arg : args) {
				parts.push_back(arg);
			}
			return cache.get_or_compute<Type>(cache.make_key(operation, parts), tag, std::forward<Compute>(compute));
		}
};

#endif /* SRC_JUDGER_EVALUATOR_HPP_ */
