/*
 * db_typedef.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_DB_TYPEDEF_HPP_
#define SRC_SHARED_SRC_DB_TYPEDEF_HPP_

#include <kerbal/utility/storage.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/functional/hash.hpp>
#include <cstdint>
#include <chrono>
#include <string>
#include <ostream>

#ifndef MYSQLPP_MYSQL_HEADERS_BURIED
#	define MYSQLPP_MYSQL_HEADERS_BURIED
#endif

#include <mysql++/stadapter.h>


/**
 * @brief 以 uuid 为字面值的 id 类型基类
 * @tparam IDType 派生出的具体 id 类型, 不同实体的 id 之间不可互相赋值
 */
template <typename IDType>
class uuid_type_base
{
	public:
		using literal_type = boost::uuids::uuid;

	protected:
		literal_type val;
		using supper_t = uuid_type_base<IDType>;

	public:
		uuid_type_base() : val(boost::uuids::nil_uuid())
		{
		}

		explicit uuid_type_base(const literal_type & val) : val(val)
		{
		}

		/**
		 * @throws std::runtime_error 字符串不是合法的 uuid 时
		 */
		explicit uuid_type_base(const std::string & s) : val(boost::uuids::string_generator()(s))
		{
		}

		static IDType generate()
		{
			static thread_local boost::uuids::random_generator gen;
			return IDType(gen());
		}

		std::string to_string() const
		{
			return boost::uuids::to_string(val);
		}

		const literal_type & to_literal() const
		{
			return val;
		}

		bool is_nil() const
		{
			return val.is_nil();
		}

		operator mysqlpp::SQLTypeAdapter() const
		{
			return this->to_string();
		}

		friend std::ostream& operator<<(std::ostream & out, const uuid_type_base & src)
		{
			out << src.val;
			return out;
		}

		friend bool operator==(const IDType & lhs, const IDType & rhs)
		{
			return lhs.val == rhs.val;
		}

		friend bool operator!=(const IDType & lhs, const IDType & rhs)
		{
			return lhs.val != rhs.val;
		}

		friend bool operator<(const IDType & lhs, const IDType & rhs)
		{
			return lhs.val < rhs.val;
		}

		struct hash
		{
				using argument_type = IDType;

				std::size_t operator()(const argument_type & id) const
				{
					return boost::hash<literal_type>()(id.val);
				}
		};
};

struct cc
{
		struct challenge_id_type : uuid_type_base<challenge_id_type>
		{
				using supper_t::supper_t;
		};

		struct user_id_type : uuid_type_base<user_id_type>
		{
				using supper_t::supper_t;
		};

		struct submission_id_type : uuid_type_base<submission_id_type>
		{
				using supper_t::supper_t;
		};

		/// 评测的时间限制与时间用量, 毫秒
		using time_literal = std::int64_t;
		using time_in_milliseconds = std::chrono::duration<time_literal, std::milli>;

		/// 评测的空间限制, MB
		using mem_literal = std::int32_t;
		using mem_in_MB = kerbal::utility::storage<mem_literal, kerbal::utility::mebi>;

		/// 沙箱报告的内存峰值, KB
		using mem_usage_in_KB_literal = std::int64_t;

		using timestamp_type = std::chrono::system_clock::time_point;

		using reward_literal = std::int64_t;
};

/**
 * @brief 时间戳与数据库中毫秒级 unix 时间之间的转换
 */
inline std::int64_t to_unix_milliseconds(const cc::timestamp_type & t)
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline cc::timestamp_type from_unix_milliseconds(std::int64_t ms)
{
	return cc::timestamp_type(std::chrono::duration_cast<cc::timestamp_type::duration>(std::chrono::milliseconds(ms)));
}

#endif /* SRC_SHARED_SRC_DB_TYPEDEF_HPP_ */
