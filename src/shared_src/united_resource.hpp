/*
 * united_resource.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_UNITED_RESOURCE_HPP_
#define SRC_SHARED_SRC_UNITED_RESOURCE_HPP_

#include <iostream>
#include <string>
#include <stdexcept>

/**
 * @brief 枚举类，标识测评结果
 */
enum class Verdict
{
	OK = 0, ///< 通过
	WRONG_ANSWER = 1, ///< 答案错误
	TIME_LIMIT_EXCEEDED = 2, ///< 超时
	MEMORY_LIMIT_EXCEEDED = 3, ///< 超内存
	NO_OUTPUT = 4, ///< 标准输出为空
	COMPILATION_ERROR = 5, ///< 编译错误
	RUNTIME_ERROR = 6, ///< 运行时错误, 即退出码非 0
};

/*
 * 对于枚举中未定义的量不在 switch 语句的 default 分支处理, 而在函数末尾处理
 * 新加了枚举值而忘了加上描述时编译器会给出警告
 */
/**
 * @brief 根据传入的 Verdict，返回其对应含义的类型说明。
 * @param verdict Verdict 类型
 * @return verdict 对应含义的类型说明, 同时也是数据库与 json 中的存储形式
 */
inline const char * getVerdictName(Verdict verdict)
{
	switch (verdict) {
		case Verdict::OK:
			return "OK";
		case Verdict::WRONG_ANSWER:
			return "WRONG_ANSWER";
		case Verdict::TIME_LIMIT_EXCEEDED:
			return "TIME_LIMIT_EXCEEDED";
		case Verdict::MEMORY_LIMIT_EXCEEDED:
			return "MEMORY_LIMIT_EXCEEDED";
		case Verdict::NO_OUTPUT:
			return "NO_OUTPUT";
		case Verdict::COMPILATION_ERROR:
			return "COMPILATION_ERROR";
		case Verdict::RUNTIME_ERROR:
			return "RUNTIME_ERROR";
	}
	return "UNKNOWN VERDICT";
}

/**
 * @brief getVerdictName 的逆操作
 * @throws std::invalid_argument 名称不对应任何 Verdict 时
 */
inline Verdict parseVerdictName(const std::string & name)
{
	for (Verdict verdict : {Verdict::OK, Verdict::WRONG_ANSWER, Verdict::TIME_LIMIT_EXCEEDED,
							Verdict::MEMORY_LIMIT_EXCEEDED, Verdict::NO_OUTPUT, Verdict::COMPILATION_ERROR,
							Verdict::RUNTIME_ERROR}) {
		if (name == getVerdictName(verdict)) {
			return verdict;
		}
	}
	throw std::invalid_argument("Undefined verdict name: " + name);
}

inline std::ostream& operator<<(std::ostream& out, Verdict verdict)
{
	return out << getVerdictName(verdict);
}

/**
 * @brief 枚举类，标识一次完整校验 (check_challenge) 失败的原因
 */
enum class CheckErrorKind
{
	SUCCESS = 0, ///< 所有测试点均通过
	NO_EXAMPLES = 1, ///< 评测程序没有声明任何样例
	ENVIRONMENT_NOT_FOUND = 2, ///< 沙箱不提供所需的运行环境
	EVALUATOR_FAILED = 3, ///< 评测程序非零退出
	INVALID_OUTPUT = 4, ///< 评测程序输出不符合约定格式
	TESTCASE_FAILED = 5, ///< 某个测试点未通过
	LIMIT_EXCEEDED = 6, ///< 题目参数超出平台限制
};

inline const char * getCheckErrorKindName(CheckErrorKind kind)
{
	switch (kind) {
		case CheckErrorKind::SUCCESS:
			return "SUCCESS";
		case CheckErrorKind::NO_EXAMPLES:
			return "NO_EXAMPLES";
		case CheckErrorKind::ENVIRONMENT_NOT_FOUND:
			return "ENVIRONMENT_NOT_FOUND";
		case CheckErrorKind::EVALUATOR_FAILED:
			return "EVALUATOR_FAILED";
		case CheckErrorKind::INVALID_OUTPUT:
			return "INVALID_OUTPUT";
		case CheckErrorKind::TESTCASE_FAILED:
			return "TESTCASE_FAILED";
		case CheckErrorKind::LIMIT_EXCEEDED:
			return "LIMIT_EXCEEDED";
	}
	return "UNKNOWN CHECK ERROR";
}

inline std::ostream& operator<<(std::ostream& out, CheckErrorKind kind)
{
	return out << getCheckErrorKindName(kind);
}

#endif /* SRC_SHARED_SRC_UNITED_RESOURCE_HPP_ */
