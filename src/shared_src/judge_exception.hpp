/*
 * judge_exception.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_JUDGE_EXCEPTION_HPP_
#define SRC_SHARED_SRC_JUDGE_EXCEPTION_HPP_

#include <exception>
#include <string>

#include "Result.hpp"

/**
 * @brief 评测过程中所有异常的基类，存有引发异常的原因。
 */
class JudgeException: public std::exception
{
	protected:
		/** 异常原因 */
		std::string reason;

	public:
		explicit JudgeException(const std::string & reason) :
				reason(reason)
		{
		}

		virtual const char * what() const noexcept
		{
			return reason.c_str();
		}
};

/**
 * @brief 与沙箱通信失败, 或沙箱返回了无法识别的响应
 */
class SandboxException: public JudgeException
{
	public:
		using JudgeException::JudgeException;
};

/**
 * @brief 沙箱不提供所请求的运行环境
 */
class EnvironmentNotFoundException: public JudgeException
{
	protected:
		std::string _environment;

	public:
		explicit EnvironmentNotFoundException(const std::string & environment) :
				JudgeException("environment not found: " + environment), _environment(environment)
		{
		}

		const std::string & environment() const noexcept
		{
			return _environment;
		}
};

/**
 * @brief 沙箱编译失败, 携带编译阶段的结果
 */
class CompileErrorException: public JudgeException
{
	protected:
		PhaseResult _build;

	public:
		explicit CompileErrorException(const PhaseResult & build) :
				JudgeException("compile error, status: " + std::to_string(build.status)), _build(build)
		{
		}

		const PhaseResult & build() const noexcept
		{
			return _build;
		}
};

/**
 * @brief 评测程序自身出错. 这类错误意味着题目本身有缺陷, 绝不能当作选手的错误答案
 */
class EvaluatorException: public JudgeException
{
	protected:
		BuildRunResult _result;

	public:
		EvaluatorException(const std::string & reason, const BuildRunResult & result) :
				JudgeException(reason), _result(result)
		{
		}

		/**
		 * @brief 评测程序这次运行的原始沙箱结果
		 */
		const BuildRunResult & result() const noexcept
		{
			return _result;
		}

		virtual CheckErrorKind kind() const noexcept = 0;
};

/**
 * @brief 评测程序非零退出
 */
class EvaluatorFailedException: public EvaluatorException
{
	public:
		explicit EvaluatorFailedException(const BuildRunResult & result) :
				EvaluatorException("evaluator exited with status " + std::to_string(result.run.status), result)
		{
		}

		virtual CheckErrorKind kind() const noexcept
		{
			return CheckErrorKind::EVALUATOR_FAILED;
		}
};

/**
 * @brief 评测程序的标准输出不是约定格式的 json
 */
class InvalidOutputException: public EvaluatorException
{
	public:
		InvalidOutputException(const std::string & detail, const BuildRunResult & result) :
				EvaluatorException("evaluator output is invalid: " + detail, result)
		{
		}

		virtual CheckErrorKind kind() const noexcept
		{
			return CheckErrorKind::INVALID_OUTPUT;
		}
};

/**
 * @brief 缓存后端读写失败
 */
class CacheException: public JudgeException
{
	public:
		using JudgeException::JudgeException;
};

/**
 * @brief 持久化层失败
 */
class StoreException: public JudgeException
{
	public:
		using JudgeException::JudgeException;
};

/**
 * @brief MySQL 查询失败, 携带 MySQL 的错误码
 */
class MysqlQueryException: public StoreException
{
	protected:
		int _errnum;

	public:
		MysqlQueryException(const std::string & event, int errnum, const char * errstr) :
				StoreException(event + " MySQL errnum: " + std::to_string(errnum) + " MySQL error: " + errstr), _errnum(errnum)
		{
		}

		int errnum() const noexcept
		{
			return _errnum;
		}
};

/**
 * @brief 发放奖励失败 (余额不足, 网络错误等)
 */
class RewardException: public JudgeException
{
	public:
		using JudgeException::JudgeException;
};

/**
 * @brief 请求的实体 (题目, 提交, 样例) 不存在
 */
class NotFoundException: public JudgeException
{
	public:
		using JudgeException::JudgeException;
};

/**
 * @brief 参考解法未能通过某个样例, 样例无法展示
 */
class ExampleGenerationFailedException: public JudgeException
{
	protected:
		CheckResult _result;

	public:
		ExampleGenerationFailedException(const std::string & seed, const CheckResult & result) :
				JudgeException("reference solution failed on example " + seed), _result(result)
		{
		}

		const CheckResult & result() const noexcept
		{
			return _result;
		}
};

#endif /* SRC_SHARED_SRC_JUDGE_EXCEPTION_HPP_ */
