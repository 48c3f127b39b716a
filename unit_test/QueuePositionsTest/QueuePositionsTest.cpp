/*
 * QueuePositionsTest.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <fstream>
#include <vector>

#include <boost/test/minimal.hpp>

#include "QueuePositions.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	void check_status(const QueuePositions & queue, std::uint64_t active, std::uint64_t waiting)
	{
		QueueStatus status = queue.status();
		BOOST_CHECK(status.workers == 3);
		BOOST_CHECK(status.active == active);
		BOOST_CHECK(status.waiting == waiting);
	}

	void check_position(const QueuePositions & queue, const cc::submission_id_type & id, std::uint64_t expect)
	{
		optional<std::uint64_t> position = queue.position(id);
		BOOST_REQUIRE(position != nullopt);
		BOOST_CHECK(*position == expect);
	}
}

int test_main(int argc, char *argv[])
{
	try {
		std::vector<cc::submission_id_type> ids;
		for (int i = 0; i < 8; ++i) {
			ids.push_back(cc::submission_id_type::generate());
		}

		QueuePositions queue(3);
		check_status(queue, 0, 0);

		const std::uint64_t expect_push[] = {0, 0, 0, 1, 2, 3};
		for (int i = 0; i < 6; ++i) {
			BOOST_CHECK(queue.push(ids[i]) == expect_push[i]);
		}
		check_status(queue, 3, 3);

		// 还在排队的任务不能出队
		BOOST_CHECK(!queue.pop(ids[3]));
		BOOST_CHECK(!queue.pop(ids[4]));
		BOOST_CHECK(!queue.pop(ids[5]));

		BOOST_CHECK(queue.pop(ids[1]));
		check_position(queue, ids[0], 0);
		BOOST_CHECK(queue.position(ids[1]) == nullopt);
		check_position(queue, ids[2], 0);
		check_position(queue, ids[3], 0);
		check_position(queue, ids[4], 1);
		check_position(queue, ids[5], 2);
		check_status(queue, 3, 2);

		BOOST_CHECK(!queue.pop(ids[1]));

		BOOST_CHECK(queue.pop(ids[2]));
		check_status(queue, 3, 1);
		check_position(queue, ids[0], 0);
		BOOST_CHECK(queue.position(ids[2]) == nullopt);
		check_position(queue, ids[3], 0);
		check_position(queue, ids[4], 0);
		check_position(queue, ids[5], 1);

		BOOST_CHECK(queue.push(ids[6]) == 2);
		check_status(queue, 3, 2);

		// 重复入队不改变位置
		BOOST_CHECK(queue.push(ids[6]) == 2);
		check_status(queue, 3, 2);

		BOOST_CHECK(queue.push(ids[7]) == 3);
		check_status(queue, 3, 3);

		BOOST_CHECK(queue.position(cc::submission_id_type::generate()) == nullopt);

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
