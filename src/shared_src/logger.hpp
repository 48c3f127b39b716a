/*
 * logger.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_LOGGER_HPP_
#define SRC_SHARED_SRC_LOGGER_HPP_

#include <iostream>
#include <sstream>
#include <fstream>
#include <typeinfo>
#include <boost/format.hpp>
#include <boost/current_function.hpp>
#include <kerbal/utility/costream.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

namespace costream_ns = kerbal::utility::costream;

/**
 * @addtogroup log_level
 * @{
 */
enum class LogLevel
{
	LEVEL_FATAL = 0, LEVEL_WARNING = 1, LEVEL_INFO = 2, LEVEL_DEBUG = 3, LEVEL_PROFILE = 4
};

/**
 * 日志告警级别萃取器
 * @tparam level 日志告警级别
 */
template <LogLevel level>
struct Log_level_traits;

template <>
struct Log_level_traits<LogLevel::LEVEL_FATAL>
{
		static constexpr const char * str = "FATAL";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_INFO>
{
		static constexpr const char * str = "INFO";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_WARNING>
{
		static constexpr const char * str = "WARNING";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_DEBUG>
{
		static constexpr const char * str = "DEBUG";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_PROFILE>
{
		static constexpr const char * str = "PROF";
		static const costream_ns::costream<std::cout> outstream;
};

/**
 * @}
 */

/**
 * @brief 日志中的任务类别, 与任务 id 一起标识日志行属于哪个对象
 */
namespace log_kind
{
	constexpr const char * JUDGER = "judger"; ///< 评测服务本身, id 一般为 0
	constexpr const char * SUBMISSION = "submission"; ///< 提交的评测任务, id 为 submission id
	constexpr const char * CHALLENGE = "challenge"; ///< 题目校验或样例生成, id 为 challenge id
}

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept;

template <typename Tp>
void multi_args_write(std::ostream & log_fp, Tp && arg0)
{
	log_fp << arg0;
}

template <typename Tp, typename ...Up>
void multi_args_write(std::ostream & log_fp, Tp && arg0, Up&& ...args)
{
	log_fp << arg0;
	multi_args_write(log_fp, std::forward<Up>(args)...);
}

namespace cc_judger
{
	namespace log
	{
		static boost::format templ("[%s] %s %s:%s [%s:%d]");
		/*           datetime logLevelStr kind id srcFileName line */

		template <typename Type>
		Type & cptr_cast(Type & src) noexcept
		{
			return src;
		}

		template <typename Type>
		const Type & cptr_cast(const Type & src) noexcept
		{
			return src;
		}

		template <typename Type>
		Type && cptr_cast(Type && src) noexcept
		{
			return std::move(src);
		}

		template <size_t N>
		constexpr const char* cptr_cast(const char (&src)[N]) noexcept
		{
			return src;
		}

		template <LogLevel level, typename JobId, typename ...T>
		void __log_write(const char * kind, const JobId & job_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
		{
			try {
				if (!log_file) {
					std::cerr << "log file is not open!" << std::endl;
					return;
				}

				const time_t now = time(NULL);
				const std::string datetime = get_ymd_hms_in_local_time_zone(now);

				std::ostringstream buffer;

				// boost::format 对象非线程安全, 每次写日志都复制一份模板
				boost::format line_templ(log::templ);
				multi_args_write(buffer, line_templ % datetime % (const char *) Log_level_traits<level>::str % kind % job_id % source_filename % line, std::forward<T>(args)...);

				Log_level_traits<level>::outstream << buffer.str() << std::endl;
				log_file << buffer.str() << std::endl;

				if (log_file.fail()) { //http://www.cplusplus.com/reference/ios/ios/fail/
					std::cerr << "write error!" << std::endl;
					log_file.clear();
					return;
				}
			} catch (const std::exception & e) {
				std::cerr << "log write failed: " << e.what() << std::endl;
			}
		}

	} /* namespace log */

} /* namespace cc_judger */

template <LogLevel level, typename JobId, typename ...T>
void log_write(const char * kind, const JobId & job_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
{
	cc_judger::log::__log_write<level>(kind, job_id, source_filename, line, log_file, cc_judger::log::cptr_cast(std::forward<T>(args))...);
}

#define UNKNOWN_EXCEPTION_WHAT (const char*)("unknown exception")

#ifdef LOG_DEBUG
#	undef LOG_DEBUG
#endif
#ifdef DEBUG
#	define LOG_DEBUG(type, job_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_DEBUG>(type, job_id, __FILE__, __LINE__, log_fp, ##x)
#else
#	define LOG_DEBUG(type, job_id, log_fp, x...)
#endif

#ifdef LOG_INFO
#	undef LOG_INFO
#endif
#define LOG_INFO(type, job_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_INFO>(type, job_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_WARNING
#	undef LOG_WARNING
#endif
#define LOG_WARNING(type, job_id, log_fp, x...)	 \
	log_write<LogLevel::LEVEL_WARNING>(type, job_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_FATAL
#	undef LOG_FATAL
#endif
#define LOG_FATAL(type, job_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_FATAL>(type, job_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_PROFILE
#	undef LOG_PROFILE
#	undef PROFILE_HEAD
#	undef PROFILE_TAIL
#endif
#ifdef PROFILE
#	define LOG_PROFILE(type, job_id, log_fp, args...) \
		log_write<LogLevel::LEVEL_PROFILE>(type, job_id, __FILE__, __LINE__, log_fp, ##args)
#	define PROFILE_HEAD \
		using namespace kerbal::compatibility::chrono_suffix; \
		auto __profile_start = std::chrono::system_clock::now();
#	define PROFILE_TAIL(type, job_id, log_fp, args...) \
		LOG_PROFILE(type, job_id, log_fp, BOOST_CURRENT_FUNCTION, ": consume: ", \
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() - __profile_start).count(), " ms ", ##args);

#	define PROFILE_WARNING_TAIL(type, job_id, log_fp, consume_threshold, args...) \
		auto __profile_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() - __profile_start); \
		if (__profile_ms > consume_threshold) { \
			PROFILE_TAIL(type, job_id, log_fp, ##args); \
		}

#else
#	define LOG_PROFILE(type, job_id, log_fp, args...)
#	define PROFILE_HEAD
#	define PROFILE_TAIL(type, job_id, log_fp, args...)
#	define PROFILE_WARNING_TAIL(type, job_id, log_fp, consume_threshold, args...)
#endif

#ifdef EXCEPT_WARNING
#	undef EXCEPT_WARNING
#endif
#define EXCEPT_WARNING(type, job_id, log_fp, events, exception, x...)	LOG_WARNING(type, job_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)
#ifdef UNKNOWN_EXCEPT_WARNING
#	undef UNKNOWN_EXCEPT_WARNING
#endif
#define UNKNOWN_EXCEPT_WARNING(type, job_id, log_fp, events, x...)	LOG_WARNING(type, job_id, log_fp, events, \
																		" Error information: ", UNKNOWN_EXCEPTION_WHAT, ##x)

#ifdef EXCEPT_FATAL
#	undef EXCEPT_FATAL
#endif
#define EXCEPT_FATAL(type, job_id, log_fp, events, exception, x...)	    LOG_FATAL(type, job_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)
#ifdef UNKNOWN_EXCEPT_FATAL
#	undef UNKNOWN_EXCEPT_FATAL
#endif
#define UNKNOWN_EXCEPT_FATAL(type, job_id, log_fp, events, x...)	    LOG_FATAL(type, job_id, log_fp, events, \
																		" Error information: ", UNKNOWN_EXCEPTION_WHAT, ##x)

#endif /* SRC_SHARED_SRC_LOGGER_HPP_ */
