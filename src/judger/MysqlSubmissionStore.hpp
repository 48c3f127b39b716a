/*
 * MysqlSubmissionStore.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_MYSQLSUBMISSIONSTORE_HPP_
#define SRC_JUDGER_MYSQLSUBMISSIONSTORE_HPP_

#include "SubmissionStore.hpp"
#include "mysql_conn_factory.hpp"

#ifndef MYSQLPP_MYSQL_HEADERS_BURIED
#	define MYSQLPP_MYSQL_HEADERS_BURIED
#endif
#include <mysql++/transaction.h>

/**
 * @brief 占用连接池中的一个连接的 MySQL 事务
 */
class MysqlStoreTransaction : public StoreTransaction
{
	private:
		mysql_conn_pool_type::auto_revert_handle conn_handle;
		mysqlpp::Transaction trans; ///< 必须在 conn_handle 之后构造, 之前析构
		bool finished;

		mysqlpp::Connection & conn()
		{
			return *conn_handle;
		}

	public:
		explicit MysqlStoreTransaction(mysql_conn_pool_type::auto_revert_handle && conn_handle);

		virtual ~MysqlStoreTransaction() noexcept;

		virtual optional<Challenge> find_challenge(const cc::challenge_id_type & id) override;

		virtual void insert_challenge(const Challenge & challenge) override;

		virtual void update_challenge(const Challenge & challenge) override;

		virtual void insert_submission(const Submission & submission) override;

		virtual optional<Submission> find_submission(const cc::submission_id_type & id) override;

		virtual std::vector<Submission> find_submissions(const cc::challenge_id_type & challenge_id, const cc::user_id_type & user_id) override;

		virtual std::vector<Submission> find_pending_submissions() override;

		virtual void insert_result(const SubmissionResult & result) override;

		virtual optional<SubmissionResult> find_result(const cc::submission_id_type & submission_id) override;

		virtual optional<UserChallengeProgress> find_progress(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id) override;

		virtual void record_attempt(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp) override;

		virtual void mark_solved(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp) override;

		virtual void commit() override;

		virtual void rollback() override;
};

class MysqlSubmissionStore : public SubmissionStore
{
	private:
		mysql_conn_pool_type & pool;
		MysqlConnectOption option;

	public:
		MysqlSubmissionStore(mysql_conn_pool_type & pool, const MysqlConnectOption & option);

		virtual std::unique_ptr<StoreTransaction> begin() override;
};

#endif /* SRC_JUDGER_MYSQLSUBMISSIONSTORE_HPP_ */
