/*
 * RewardSerializerTest.cpp
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

#include "RewardSerializer.hpp"

std::ofstream log_fp("/dev/null");

int test_main(int argc, char *argv[])
{
	try {
		const RewardKey key {cc::challenge_id_type::generate(), cc::user_id_type::generate()};
		const RewardKey other_key {key.challenge_id, cc::user_id_type::generate()};

		BOOST_CHECK(key == RewardKey({key.challenge_id, key.user_id}));
		BOOST_CHECK(!(key == other_key));

		{
			// 同一个键互斥
			RewardSerializer serializer;
			std::atomic<int> inside(0);
			std::atomic<int> max_inside(0);
			int counter = 0;

			std::vector<std::future<void> > tasks;
			for (int i = 0; i < 8; ++i) {
				tasks.push_back(std::async(std::launch::async, [&]() {
					for (int j = 0; j < 50; ++j) {
						serializer.with_lock(key, [&]() {
							int now = ++inside;
							if (now > max_inside) {
								max_inside = now;
							}
							int read = counter;
							std::this_thread::yield();
							counter = read + 1;
							--inside;
						});
					}
				}));
			}
			for (auto & task : tasks) {
				task.get();
			}
			BOOST_CHECK(counter == 400);
			BOOST_CHECK(max_inside == 1);
			BOOST_CHECK(serializer.size() == 0);
		}

		{
			// 不同的键互不阻塞
			RewardSerializer serializer;
			RewardSerializer::lock_guard held = serializer.lock(key);
			BOOST_CHECK(serializer.size() == 1);

			std::future<bool> other = std::async(std::launch::async, [&]() {
				return serializer.with_lock(other_key, []() {
					return true;
				});
			});
			BOOST_REQUIRE(other.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
			BOOST_CHECK(other.get());

			// 同一个键要等到持有者释放
			std::atomic<bool> acquired(false);
			std::future<void> same = std::async(std::launch::async, [&]() {
				serializer.with_lock(key, [&]() {
					acquired = true;
				});
			});
			BOOST_CHECK(same.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout);
			BOOST_CHECK(!acquired);

			{
				RewardSerializer::lock_guard release(std::move(held));
			}
			same.get();
			BOOST_CHECK(acquired);
			BOOST_CHECK(serializer.size() == 0);
		}

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
