/*
 * JudgeSchedulerTest.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <fstream>
#include <atomic>
#include <future>
#include <thread>
#include <vector>

#include <boost/test/minimal.hpp>

#include "JudgeScheduler.hpp"
#include "judge_exception.hpp"

std::ofstream log_fp("/dev/null");

int test_main(int argc, char *argv[])
{
	try {
		try {
			JudgeScheduler scheduler(0);
			BOOST_FAIL("std::invalid_argument expected");
		} catch (const std::invalid_argument & e) {
		}

		{
			std::atomic<int> running(0);
			std::atomic<int> max_running(0);
			std::atomic<int> finished(0);
			std::promise<void> gate;
			std::shared_future<void> opened = gate.get_future().share();

			JudgeScheduler scheduler(3);
			std::vector<cc::submission_id_type> ids;
			for (int i = 0; i < 12; ++i) {
				ids.push_back(cc::submission_id_type::generate());
				const std::uint64_t position = scheduler.enqueue(ids.back(), [&, opened]() {
					opened.wait();
					int now = ++running;
					int seen = max_running.load();
					while (now > seen && !max_running.compare_exchange_weak(seen, now)) {
					}
					std::this_thread::sleep_for(std::chrono::milliseconds(20));
					--running;
					++finished;
				});
				BOOST_CHECK(position == (i < 3 ? 0 : i - 2));
			}

			QueueStatus status = scheduler.status();
			BOOST_CHECK(status.workers == 3);
			BOOST_CHECK(status.active == 3);
			BOOST_CHECK(status.waiting == 9);

			// 已在队中的任务不重复入队
			std::atomic<int> duplicate_runs(0);
			BOOST_CHECK(scheduler.enqueue(ids.back(), [&]() {
				++duplicate_runs;
			}) == 9);
			BOOST_CHECK(scheduler.status().waiting == 9);

			gate.set_value();
			scheduler.shutdown();
			BOOST_CHECK(finished == 12);
			BOOST_CHECK(duplicate_runs == 0);
			BOOST_CHECK(max_running <= 3);
			BOOST_CHECK(max_running >= 1);

			for (const cc::submission_id_type & id : ids) {
				BOOST_CHECK(scheduler.position(id) == nullopt);
			}
			status = scheduler.status();
			BOOST_CHECK(status.active == 0 && status.waiting == 0);

			try {
				scheduler.enqueue(cc::submission_id_type::generate(), []() {
				});
				BOOST_FAIL("JudgeException expected");
			} catch (const JudgeException & e) {
			}
		}

		{
			// 任务抛出的异常不影响评测线程
			std::atomic<int> finished(0);
			JudgeScheduler scheduler(1);
			scheduler.enqueue(cc::submission_id_type::generate(), []() {
				throw std::runtime_error("task failed");
			});
			scheduler.enqueue(cc::submission_id_type::generate(), [&]() {
				++finished;
			});
			scheduler.shutdown();
			BOOST_CHECK(finished == 1);
		}

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
