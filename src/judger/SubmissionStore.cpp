/*
 * SubmissionStore.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "SubmissionStore.hpp"

void to_json(nlohmann::json & j, const Challenge & src)
{
	j = nlohmann::json {
		{"id", src.id.to_string()},
		{"creator", src.creator.to_string()},
		{"description", src.description},
		{"time_limit", src.time_limit.count()},
		{"memory_limit", src.memory_limit.count()},
		{"static_tests", src.static_tests},
		{"random_tests", src.random_tests},
		{"evaluator", src.evaluator},
		{"solution_environment", src.solution_environment},
		{"solution_code", src.solution_code},
		{"xp", src.xp},
		{"coins", src.coins},
	};
}

void to_json(nlohmann::json & j, const Submission & src)
{
	j = nlohmann::json {
		{"id", src.id.to_string()},
		{"challenge_id", src.challenge_id.to_string()},
		{"creator", src.creator.to_string()},
		{"creation_timestamp", to_unix_milliseconds(src.creation_timestamp)},
		{"environment", src.environment},
		{"code", src.code},
	};
}

void to_json(nlohmann::json & j, const SubmissionResult & src)
{
	j = nlohmann::json::object();
	j["verdict"] = getVerdictName(src.verdict);
	j["reason"] = src.reason != nullopt ? nlohmann::json(*src.reason) : nlohmann::json(nullptr);

	for (const auto & phase : {std::make_pair("build", &src.build), std::make_pair("run", &src.run)}) {
		const optional<PhaseResult> & result = *phase.second;
		if (result == nullopt) {
			j[phase.first] = nullptr;
			continue;
		}
		j[phase.first] = {
			{"status", (*result).status},
			{"stderr", (*result).std_err},
			{"time", (*result).resource_usage.time.count()},
			{"memory", (*result).resource_usage.memory},
		};
	}
}
