/*
 * QueuePositions.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "QueuePositions.hpp"

#include <algorithm>

void to_json(nlohmann::json & j, const QueueStatus & src)
{
	j = nlohmann::json {
		{"workers", src.workers},
		{"active", src.active},
		{"waiting", src.waiting},
	};
}

QueuePositions::QueuePositions(std::uint64_t workers) :
		workers(workers), counter(0), done(0)
{
}

std::uint64_t QueuePositions::id_position(std::uint64_t ticket) const
{
	const std::uint64_t ahead = workers + done;
	return ticket > ahead ? ticket - ahead : 0;
}

std::uint64_t QueuePositions::push(const cc::submission_id_type & id)
{
	auto it = ids.find(id);
	if (it == ids.end()) {
		it = ids.emplace(id, ++counter).first;
	}
	return this->id_position(it->second);
}

bool QueuePositions::pop(const cc::submission_id_type & id)
{
	auto it = ids.find(id);
	if (it == ids.end() || this->id_position(it->second) != 0) {
		return false;
	}
	ids.erase(it);
	++done;
	return true;
}

optional<std::uint64_t> QueuePositions::position(const cc::submission_id_type & id) const
{
	auto it = ids.find(id);
	if (it == ids.end()) {
		return nullopt;
	}
	return this->id_position(it->second);
}

QueueStatus QueuePositions::status() const
{
	QueueStatus status;
	status.workers = workers;
	status.active = std::min(workers, counter - done);
	status.waiting = this->id_position(counter);
	return status;
}
