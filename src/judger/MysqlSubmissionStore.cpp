/*
 * MysqlSubmissionStore.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "MysqlSubmissionStore.hpp"
#include "judge_exception.hpp"
#include "logger.hpp"

#ifndef MYSQLPP_MYSQL_HEADERS_BURIED
#	define MYSQLPP_MYSQL_HEADERS_BURIED
#endif
#include <mysql++/query.h>
#include <mysql++/result.h>
#include <mysql++/row.h>

extern std::ofstream log_fp;

namespace
{
	std::string as_string(const mysqlpp::String & field)
	{
		return std::string(field.data(), field.length());
	}

	template <typename Type>
	Type as(const mysqlpp::String & field)
	{
		return field.conv<Type>(Type());
	}

	optional<cc::timestamp_type> as_timestamp(const mysqlpp::String & field)
	{
		if (field.is_null()) {
			return nullopt;
		}
		return from_unix_milliseconds(as<std::int64_t>(field));
	}

	template <typename Type>
	void put_nullable(mysqlpp::Query & query, const optional<Type> & value)
	{
		if (value == nullopt) {
			query << "NULL";
		} else {
			query << *value;
		}
	}

	void put_nullable(mysqlpp::Query & query, const optional<std::string> & value)
	{
		if (value == nullopt) {
			query << "NULL";
		} else {
			query << mysqlpp::quote << *value;
		}
	}

	void put_phase(mysqlpp::Query & query, const optional<PhaseResult> & phase)
	{
		if (phase == nullopt) {
			query << "NULL, NULL, NULL, NULL";
			return;
		}
		query << (*phase).status << ','
				<< mysqlpp::quote << (*phase).std_err << ','
				<< (*phase).resource_usage.time.count() << ','
				<< (*phase).resource_usage.memory;
	}

	optional<PhaseResult> get_phase(const mysqlpp::Row & row, const char * status, const char * std_err, const char * time, const char * memory)
	{
		if (row[status].is_null()) {
			return nullopt;
		}
		PhaseResult phase;
		phase.status = as<int>(row[status]);
		phase.std_err = as_string(row[std_err]);
		phase.resource_usage.time = cc::time_in_milliseconds(as<cc::time_literal>(row[time]));
		phase.resource_usage.memory = as<cc::mem_usage_in_KB_literal>(row[memory]);
		return phase;
	}

	Challenge get_challenge(const mysqlpp::Row & row)
	{
		Challenge challenge;
		challenge.id = cc::challenge_id_type(as_string(row["id"]));
		challenge.creator = cc::user_id_type(as_string(row["creator"]));
		challenge.description = as_string(row["description"]);
		challenge.time_limit = cc::time_in_milliseconds(as<cc::time_literal>(row["time_limit"]));
		challenge.memory_limit = cc::mem_in_MB(as<cc::mem_literal>(row["memory_limit"]));
		challenge.static_tests = as<int>(row["static_tests"]);
		challenge.random_tests = as<int>(row["random_tests"]);
		challenge.evaluator = as_string(row["evaluator"]);
		challenge.solution_environment = as_string(row["solution_environment"]);
		challenge.solution_code = as_string(row["solution_code"]);
		challenge.xp = as<cc::reward_literal>(row["xp"]);
		challenge.coins = as<cc::reward_literal>(row["coins"]);
		return challenge;
	}

	Submission get_submission(const mysqlpp::Row & row)
	{
		Submission submission;
		submission.id = cc::submission_id_type(as_string(row["id"]));
		submission.challenge_id = cc::challenge_id_type(as_string(row["challenge_id"]));
		submission.creator = cc::user_id_type(as_string(row["creator"]));
		submission.creation_timestamp = from_unix_milliseconds(as<std::int64_t>(row["creation_timestamp"]));
		submission.environment = as_string(row["environment"]);
		submission.code = as_string(row["code"]);
		return submission;
	}

	constexpr const char * CHALLENGE_COLUMNS = "id, creator, description, time_limit, memory_limit, static_tests, random_tests, "
												"evaluator, solution_environment, solution_code, xp, coins";

	constexpr const char * SUBMISSION_COLUMNS = "s.id, s.challenge_id, s.creator, s.creation_timestamp, s.environment, s.code";
}

MysqlStoreTransaction::MysqlStoreTransaction(mysql_conn_pool_type::auto_revert_handle && conn_handle) :
		conn_handle(std::move(conn_handle)), trans(*this->conn_handle), finished(false)
{
	if (this->conn().errnum() != 0) {
		throw MysqlQueryException("Start transaction failed!", this->conn().errnum(), this->conn().error());
	}
}

MysqlStoreTransaction::~MysqlStoreTransaction() noexcept
{
	if (!finished) {
		LOG_DEBUG(log_kind::JUDGER, 0, log_fp, "Transaction is rolled back on destruction.");
	}
	// 未提交时 mysqlpp::Transaction 的析构会回滚
}

optional<Challenge> MysqlStoreTransaction::find_challenge(const cc::challenge_id_type & id)
{
	mysqlpp::Query query = this->conn().query();
	query << "select " << CHALLENGE_COLUMNS << " from cc_challenge where id = " << mysqlpp::quote << id.to_string();

	mysqlpp::StoreQueryResult res = query.store();
	if (!res) {
		throw MysqlQueryException("Query challenge failed!", query.errnum(), query.error());
	}
	if (res.empty()) {
		return nullopt;
	}
	return get_challenge(res[0]);
}

void MysqlStoreTransaction::insert_challenge(const Challenge & challenge)
{
	mysqlpp::Query insert = this->conn().query();
	insert << "insert into cc_challenge (" << CHALLENGE_COLUMNS << ") values ("
			<< mysqlpp::quote << challenge.id.to_string() << ','
			<< mysqlpp::quote << challenge.creator.to_string() << ','
			<< mysqlpp::quote << challenge.description << ','
			<< challenge.time_limit.count() << ','
			<< challenge.memory_limit.count() << ','
			<< challenge.static_tests << ','
			<< challenge.random_tests << ','
			<< mysqlpp::quote << challenge.evaluator << ','
			<< mysqlpp::quote << challenge.solution_environment << ','
			<< mysqlpp::quote << challenge.solution_code << ','
			<< challenge.xp << ','
			<< challenge.coins << ')';

	mysqlpp::SimpleResult res = insert.execute();
	if (!res) {
		throw MysqlQueryException("Insert challenge failed!", insert.errnum(), insert.error());
	}
}

void MysqlStoreTransaction::update_challenge(const Challenge & challenge)
{
	mysqlpp::Query update = this->conn().query();
	update << "update cc_challenge set "
			<< "description = " << mysqlpp::quote << challenge.description << ','
			<< "time_limit = " << challenge.time_limit.count() << ','
			<< "memory_limit = " << challenge.memory_limit.count() << ','
			<< "static_tests = " << challenge.static_tests << ','
			<< "random_tests = " << challenge.random_tests << ','
			<< "evaluator = " << mysqlpp::quote << challenge.evaluator << ','
			<< "solution_environment = " << mysqlpp::quote << challenge.solution_environment << ','
			<< "solution_code = " << mysqlpp::quote << challenge.solution_code << ','
			<< "xp = " << challenge.xp << ','
			<< "coins = " << challenge.coins
			<< " where id = " << mysqlpp::quote << challenge.id.to_string();

	mysqlpp::SimpleResult res = update.execute();
	if (!res) {
		throw MysqlQueryException("Update challenge failed!", update.errnum(), update.error());
	}
}

void MysqlStoreTransaction::insert_submission(const Submission & submission)
{
	mysqlpp::Query insert = this->conn().query();
	insert << "insert into cc_submission (id, challenge_id, creator, creation_timestamp, environment, code) values ("
			<< mysqlpp::quote << submission.id.to_string() << ','
			<< mysqlpp::quote << submission.challenge_id.to_string() << ','
			<< mysqlpp::quote << submission.creator.to_string() << ','
			<< to_unix_milliseconds(submission.creation_timestamp) << ','
			<< mysqlpp::quote << submission.environment << ','
			<< mysqlpp::quote << submission.code << ')';

	mysqlpp::SimpleResult res = insert.execute();
	if (!res) {
		throw MysqlQueryException("Insert submission failed!", insert.errnum(), insert.error());
	}
}

optional<Submission> MysqlStoreTransaction::find_submission(const cc::submission_id_type & id)
{
	mysqlpp::Query query = this->conn().query();
	query << "select " << SUBMISSION_COLUMNS << " from cc_submission s where s.id = " << mysqlpp::quote << id.to_string();

	mysqlpp::StoreQueryResult res = query.store();
	if (!res) {
		throw MysqlQueryException("Query submission failed!", query.errnum(), query.error());
	}
	if (res.empty()) {
		return nullopt;
	}
	return get_submission(res[0]);
}

std::vector<Submission> MysqlStoreTransaction::find_submissions(const cc::challenge_id_type & challenge_id, const cc::user_id_type & user_id)
{
	mysqlpp::Query query = this->conn().query();
	query << "select " << SUBMISSION_COLUMNS << " from cc_submission s "
			"where s.challenge_id = " << mysqlpp::quote << challenge_id.to_string()
			<< " and s.creator = " << mysqlpp::quote << user_id.to_string()
			<< " order by s.creation_timestamp desc";

	mysqlpp::StoreQueryResult res = query.store();
	if (!res) {
		throw MysqlQueryException("Query user submissions failed!", query.errnum(), query.error());
	}

	std::vector<Submission> submissions;
	submissions.reserve(res.num_rows());
	for (const mysqlpp::Row & row : res) {
		submissions.push_back(get_submission(row));
	}
	return submissions;
}

std::vector<Submission> MysqlStoreTransaction::find_pending_submissions()
{
	mysqlpp::Query query = this->conn().query();
	query << "select " << SUBMISSION_COLUMNS << " from cc_submission s "
			"left join cc_submission_result r on r.submission_id = s.id "
			"where r.submission_id is null "
			"order by s.creation_timestamp asc";

	mysqlpp::StoreQueryResult res = query.store();
	if (!res) {
		throw MysqlQueryException("Query pending submissions failed!", query.errnum(), query.error());
	}

	std::vector<Submission> submissions;
	submissions.reserve(res.num_rows());
	for (const mysqlpp::Row & row : res) {
		submissions.push_back(get_submission(row));
	}
	return submissions;
}

void MysqlStoreTransaction::insert_result(const SubmissionResult & result)
{
	mysqlpp::Query insert = this->conn().query();
	insert << "insert into cc_submission_result "
			"(submission_id, verdict, reason, "
			"build_status, build_stderr, build_time, build_memory, "
			"run_status, run_stderr, run_time, run_memory) values ("
			<< mysqlpp::quote << result.submission_id.to_string() << ','
			<< mysqlpp::quote << getVerdictName(result.verdict) << ',';
	put_nullable(insert, result.reason);
	insert << ',';
	put_phase(insert, result.build);
	insert << ',';
	put_phase(insert, result.run);
	insert << ')';

	mysqlpp::SimpleResult res = insert.execute();
	if (!res) {
		throw MysqlQueryException("Insert submission result failed!", insert.errnum(), insert.error());
	}
}

optional<SubmissionResult> MysqlStoreTransaction::find_result(const cc::submission_id_type & submission_id)
{
	mysqlpp::Query query = this->conn().query();
	query << "select submission_id, verdict, reason, "
			"build_status, build_stderr, build_time, build_memory, "
			"run_status, run_stderr, run_time, run_memory "
			"from cc_submission_result where submission_id = " << mysqlpp::quote << submission_id.to_string();

	mysqlpp::StoreQueryResult res = query.store();
	if (!res) {
		throw MysqlQueryException("Query submission result failed!", query.errnum(), query.error());
	}
	if (res.empty()) {
		return nullopt;
	}

	const mysqlpp::Row & row = res[0];
	SubmissionResult result;
	result.submission_id = submission_id;
	try {
		result.verdict = parseVerdictName(as_string(row["verdict"]));
	} catch (const std::invalid_argument & e) {
		throw StoreException(std::string("Broken submission result: ") + e.what());
	}
	if (!row["reason"].is_null()) {
		result.reason = as_string(row["reason"]);
	}
	result.build = get_phase(row, "build_status", "build_stderr", "build_time", "build_memory");
	result.run = get_phase(row, "run_status", "run_stderr", "run_time", "run_memory");
	return result;
}

optional<UserChallengeProgress> MysqlStoreTransaction::find_progress(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id)
{
	mysqlpp::Query query = this->conn().query(
			"select unlocked_timestamp, solved_timestamp, last_attempt_timestamp, attempts, rating "
			"from cc_user_challenge where user_id = %0q and challenge_id = %1q for update"
	);
	query.parse();

	mysqlpp::StoreQueryResult res = query.store(user_id, challenge_id);
	if (!res) {
		throw MysqlQueryException("Query user challenge progress failed!", query.errnum(), query.error());
	}
	if (res.empty()) {
		return nullopt;
	}

	const mysqlpp::Row & row = res[0];
	UserChallengeProgress progress;
	progress.user_id = user_id;
	progress.challenge_id = challenge_id;
	progress.unlocked_timestamp = as_timestamp(row["unlocked_timestamp"]);
	progress.solved_timestamp = as_timestamp(row["solved_timestamp"]);
	progress.last_attempt_timestamp = as_timestamp(row["last_attempt_timestamp"]);
	progress.attempts = as<std::int32_t>(row["attempts"]);
	if (!row["rating"].is_null()) {
		progress.rating = as<std::int32_t>(row["rating"]);
	}
	return progress;
}

void MysqlStoreTransaction::record_attempt(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp)
{
	mysqlpp::Query insert = this->conn().query(
			"insert into cc_user_challenge (user_id, challenge_id, last_attempt_timestamp, attempts) "
			"values (%0q, %1q, %2, 1) "
			"on duplicate key update attempts = attempts + 1, last_attempt_timestamp = values(last_attempt_timestamp)"
	);
	insert.parse();

	mysqlpp::SimpleResult res = insert.execute(user_id, challenge_id, to_unix_milliseconds(timestamp));
	if (!res) {
		throw MysqlQueryException("Record attempt failed!", insert.errnum(), insert.error());
	}
}

void MysqlStoreTransaction::mark_solved(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp)
{
	mysqlpp::Query update = this->conn().query(
			"update cc_user_challenge set solved_timestamp = %2 "
			"where user_id = %0q and challenge_id = %1q and solved_timestamp is null"
	);
	update.parse();

	mysqlpp::SimpleResult res = update.execute(user_id, challenge_id, to_unix_milliseconds(timestamp));
	if (!res) {
		throw MysqlQueryException("Mark solved failed!", update.errnum(), update.error());
	}
}

void MysqlStoreTransaction::commit()
{
	trans.commit();
	if (this->conn().errnum() != 0) {
		throw MysqlQueryException("Commit failed!", this->conn().errnum(), this->conn().error());
	}
	finished = true;
}

void MysqlStoreTransaction::rollback()
{
	trans.rollback();
	finished = true;
	if (this->conn().errnum() != 0) {
		throw MysqlQueryException("Rollback failed!", this->conn().errnum(), this->conn().error());
	}
}

MysqlSubmissionStore::MysqlSubmissionStore(mysql_conn_pool_type & pool, const MysqlConnectOption & option) :
		pool(pool), option(option)
{
}

std::unique_ptr<StoreTransaction> MysqlSubmissionStore::begin()
{
	return std::unique_ptr<StoreTransaction>(new MysqlStoreTransaction(sync_fetch_mysql_conn(pool, option)));
}
