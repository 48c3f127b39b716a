/*
 * JudgeScheduler.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "JudgeScheduler.hpp"
#include "judge_exception.hpp"
#include "logger.hpp"

extern std::ofstream log_fp;

JudgeScheduler::JudgeScheduler(std::size_t worker_count) :
		positions(worker_count), stopping(false)
{
	if (worker_count == 0) {
		throw std::invalid_argument("judge scheduler needs at least one worker");
	}
	workers.reserve(worker_count);
	try {
		for (std::size_t i = 0; i < worker_count; ++i) {
			workers.emplace_back(&JudgeScheduler::worker_loop, this);
		}
	} catch (...) {
		this->shutdown();
		throw;
	}
	LOG_INFO(log_kind::JUDGER, 0, log_fp, "Judge scheduler started with ", worker_count, " workers.");
}

JudgeScheduler::~JudgeScheduler() noexcept
{
	this->shutdown();
}

std::uint64_t JudgeScheduler::enqueue(const cc::submission_id_type & id, task_type task)
{
	std::uint64_t position;
	{
		std::lock_guard<std::mutex> lck(mtx);
		if (stopping) {
			throw JudgeException("judge scheduler is shutting down");
		}
		optional<std::uint64_t> queued = positions.position(id);
		if (queued != nullopt) {
			return *queued;
		}
		tasks.emplace_back(id, std::move(task));
		position = positions.push(id);
	}
	task_available.notify_one();
	LOG_DEBUG(log_kind::SUBMISSION, id, log_fp, "Enqueued at position ", position);
	return position;
}

optional<std::uint64_t> JudgeScheduler::position(const cc::submission_id_type & id)
{
	std::lock_guard<std::mutex> lck(mtx);
	return positions.position(id);
}

QueueStatus JudgeScheduler::status()
{
	std::lock_guard<std::mutex> lck(mtx);
	return positions.status();
}

void JudgeScheduler::worker_loop() noexcept
{
	while (true) {
		std::pair<cc::submission_id_type, task_type> job;
		{
			std::unique_lock<std::mutex> lck(mtx);
			task_available.wait(lck, [this]() {
				return stopping || !tasks.empty();
			});
			if (tasks.empty()) {
				return; // stopping 且队列已空
			}
			job = std::move(tasks.front());
			tasks.pop_front();
		}

		try {
			job.second();
		} catch (const std::exception & e) {
			EXCEPT_FATAL(log_kind::SUBMISSION, job.first, log_fp, "Judge task escaped with an exception.", e);
			//DO NOT THROW
		} catch (...) {
			UNKNOWN_EXCEPT_FATAL(log_kind::SUBMISSION, job.first, log_fp, "Judge task escaped with an exception.");
			//DO NOT THROW
		}

		std::lock_guard<std::mutex> lck(mtx);
		if (!positions.pop(job.first)) {
			LOG_WARNING(log_kind::SUBMISSION, job.first, log_fp, "Finished task is not at the head of the queue.");
		}
	}
}

void JudgeScheduler::shutdown() noexcept
{
	{
		std::lock_guard<std::mutex> lck(mtx);
		stopping = true;
	}
	task_available.notify_all();
	for (std::thread & worker : workers) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}
