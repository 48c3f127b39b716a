/*
 * MemorySubmissionStore.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef UNIT_TEST_FAKE_MEMORYSUBMISSIONSTORE_HPP_
#define UNIT_TEST_FAKE_MEMORYSUBMISSIONSTORE_HPP_

#include "SubmissionStore.hpp"
#include "judge_exception.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

/**
 * @brief 内存中的持久化层
 * 事务的写操作先暂存, commit 时在锁内一次性应用; 事务内的读能看到本事务暂存的写
 */
class MemorySubmissionStore : public SubmissionStore
{
	public:
		struct State
		{
				std::map<std::string, Challenge> challenges;
				std::map<std::string, Submission> submissions;
				std::map<std::string, SubmissionResult> results;
				std::map<std::pair<std::string, std::string>, UserChallengeProgress> progress;
		};

		std::atomic<int> commits {0};
		std::atomic<int> rollbacks {0};
		std::atomic<int> open_transactions {0}; ///< 尚未析构的事务数

	private:
		std::mutex mtx;
		State committed;

		class Transaction : public StoreTransaction
		{
			private:
				typedef std::function<void(State &)> write_type;

				MemorySubmissionStore & store;
				std::vector<write_type> writes;
				bool finished;

				State view()
				{
					std::lock_guard<std::mutex> lck(store.mtx);
					State state = store.committed;
					for (const write_type & write : writes) {
						write(state);
					}
					return state;
				}

				static std::pair<std::string, std::string> progress_key(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id)
				{
					return std::make_pair(user_id.to_string(), challenge_id.to_string());
				}

			public:
				explicit Transaction(MemorySubmissionStore & store) :
						store(store), finished(false)
				{
					++store.open_transactions;
				}

				virtual ~Transaction() noexcept
				{
					if (!finished) {
						++store.rollbacks;
					}
					--store.open_transactions;
				}

				virtual optional<Challenge> find_challenge(const cc::challenge_id_type & id) override
				{
					State state = this->view();
					auto it = state.challenges.find(id.to_string());
					if (it == state.challenges.end()) {
						return nullopt;
					}
					return it->second;
				}

				virtual void insert_challenge(const Challenge & challenge) override
				{
					writes.push_back([challenge](State & state) {
						if (!state.challenges.emplace(challenge.id.to_string(), challenge).second) {
							throw StoreException("duplicate challenge");
						}
					});
				}

				virtual void update_challenge(const Challenge & challenge) override
				{
					writes.push_back([challenge](State & state) {
						state.challenges[challenge.id.to_string()] = challenge;
					});
				}

				virtual void insert_submission(const Submission & submission) override
				{
					writes.push_back([submission](State & state) {
						if (!state.submissions.emplace(submission.id.to_string(), submission).second) {
							throw StoreException("duplicate submission");
						}
					});
				}

				virtual optional<Submission> find_submission(const cc::submission_id_type & id) override
				{
					State state = this->view();
					auto it = state.submissions.find(id.to_string());
					if (it == state.submissions.end()) {
						return nullopt;
					}
					return it->second;
				}

				virtual std::vector<Submission> find_submissions(const cc::challenge_id_type & challenge_id, const cc::user_id_type & user_id) override
				{
					State state = this->view();
					std::vector<Submission> submissions;
					for (const auto & item : state.submissions) {
						if (item.second.challenge_id == challenge_id && item.second.creator == user_id) {
							submissions.push_back(item.second);
						}
					}
					std::stable_sort(submissions.begin(), submissions.end(), [](const Submission & lhs, const Submission & rhs) {
						return lhs.creation_timestamp > rhs.creation_timestamp;
					});
					return submissions;
				}

				virtual std::vector<Submission> find_pending_submissions() override
				{
					State state = this->view();
					std::vector<Submission> pending;
					for (const auto & item : state.submissions) {
						if (state.results.count(item.first) == 0) {
							pending.push_back(item.second);
						}
					}
					std::stable_sort(pending.begin(), pending.end(), [](const Submission & lhs, const Submission & rhs) {
						return lhs.creation_timestamp < rhs.creation_timestamp;
					});
					return pending;
				}

				virtual void insert_result(const SubmissionResult & result) override
				{
					writes.push_back([result](State & state) {
						if (!state.results.emplace(result.submission_id.to_string(), result).second) {
							throw StoreException("duplicate submission result");
						}
					});
				}

				virtual optional<SubmissionResult> find_result(const cc::submission_id_type & submission_id) override
				{
					State state = this->view();
					auto it = state.results.find(submission_id.to_string());
					if (it == state.results.end()) {
						return nullopt;
					}
					return it->second;
				}

				virtual optional<UserChallengeProgress> find_progress(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id) override
				{
					State state = this->view();
					auto it = state.progress.find(progress_key(user_id, challenge_id));
					if (it == state.progress.end()) {
						return nullopt;
					}
					return it->second;
				}

				virtual void record_attempt(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp) override
				{
					writes.push_back([user_id, challenge_id, timestamp](State & state) {
						UserChallengeProgress & progress = state.progress[progress_key(user_id, challenge_id)];
						progress.user_id = user_id;
						progress.challenge_id = challenge_id;
						++progress.attempts;
						progress.last_attempt_timestamp = timestamp;
					});
				}

				virtual void mark_solved(const cc::user_id_type & user_id, const cc::challenge_id_type & challenge_id, const cc::timestamp_type & timestamp) override
				{
					writes.push_back([user_id, challenge_id, timestamp](State & state) {
						auto it = state.progress.find(progress_key(user_id, challenge_id));
						if (it != state.progress.end() && !it->second.solved()) {
							it->second.solved_timestamp = timestamp;
						}
					});
				}

				virtual void commit() override
				{
					std::lock_guard<std::mutex> lck(store.mtx);
					State state = store.committed;
					for (const write_type & write : writes) {
						write(state);
					}
					store.committed = std::move(state);
					writes.clear();
					finished = true;
					++store.commits;
				}

				virtual void rollback() override
				{
					writes.clear();
					finished = true;
					++store.rollbacks;
				}
		};

	public:
		virtual std::unique_ptr<StoreTransaction> begin() override
		{
			return std::unique_ptr<StoreTransaction>(new Transaction(*this));
		}

		State snapshot()
		{
			std::lock_guard<std::mutex> lck(mtx);
			return committed;
		}

		/**
		 * @brief 直接写入一道题目, 不经过校验
		 */
		void put_challenge(const Challenge & challenge)
		{
			std::lock_guard<std::mutex> lck(mtx);
			committed.challenges[challenge.id.to_string()] = challenge;
		}
};

#endif /* UNIT_TEST_FAKE_MEMORYSUBMISSIONSTORE_HPP_ */
