/*
 * Result.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "Result.hpp"

namespace
{
	template <typename Type>
	void optional_to_json(nlohmann::json & j, const char * key, const optional<Type> & src)
	{
		if (src != nullopt) {
			j[key] = *src;
		} else {
			j[key] = nullptr;
		}
	}

	template <typename Type>
	void optional_from_json(const nlohmann::json & j, const char * key, optional<Type> & dst)
	{
		auto it = j.find(key);
		if (it == j.end() || it->is_null()) {
			dst = nullopt;
		} else {
			dst = it->get<Type>();
		}
	}
}

std::ostream& operator<<(std::ostream& out, const PhaseResult & src)
{
	return out << "status: " << src.status
			<< " time: " << src.resource_usage.time.count() << " ms"
			<< " memory: " << src.resource_usage.memory << " KB"
			<< " stdout size: " << src.std_out.size()
			<< " stderr size: " << src.std_err.size();
}

std::ostream& operator<<(std::ostream& out, const BuildRunResult & src)
{
	if (src.build != nullopt) {
		out << "build: {" << *src.build << "} ";
	}
	return out << "run: {" << src.run << "}";
}

std::ostream& operator<<(std::ostream& out, const CheckResult & src)
{
	out << "verdict: " << src.verdict;
	if (src.reason != nullopt) {
		out << " reason: " << *src.reason;
	}
	if (src.run != nullopt) {
		out << " run: {" << *src.run << "}";
	}
	return out;
}

std::ostream& operator<<(std::ostream& out, const CheckOutcome & src)
{
	out << "kind: " << src.kind;
	switch (src.kind) {
		case CheckErrorKind::TESTCASE_FAILED:
			out << " seed: " << src.seed << " " << src.result;
			break;
		case CheckErrorKind::EVALUATOR_FAILED:
		case CheckErrorKind::INVALID_OUTPUT:
			if (src.evaluator_result != nullopt) {
				out << " " << *src.evaluator_result;
			}
			break;
		case CheckErrorKind::ENVIRONMENT_NOT_FOUND:
		case CheckErrorKind::LIMIT_EXCEEDED:
			out << " message: " << src.message;
			break;
		case CheckErrorKind::SUCCESS:
		case CheckErrorKind::NO_EXAMPLES:
			break;
	}
	return out;
}

CheckOutcome CheckOutcome::testcase_failed(const std::string & seed, const CheckResult & result)
{
	CheckOutcome outcome(CheckErrorKind::TESTCASE_FAILED);
	outcome.seed = seed;
	outcome.result = result;
	return outcome;
}

CheckOutcome CheckOutcome::evaluator_failed(CheckErrorKind kind, const BuildRunResult & evaluator_result)
{
	CheckOutcome outcome(kind);
	outcome.evaluator_result = evaluator_result;
	return outcome;
}

CheckOutcome CheckOutcome::with_message(CheckErrorKind kind, const std::string & message)
{
	CheckOutcome outcome(kind);
	outcome.message = message;
	return outcome;
}

void to_json(nlohmann::json & j, const ResourceUsage & src)
{
	j = nlohmann::json {
		{"time", src.time.count()},
		{"memory", src.memory},
	};
}

void from_json(const nlohmann::json & j, ResourceUsage & dst)
{
	dst.time = cc::time_in_milliseconds(j.at("time").get<cc::time_literal>());
	dst.memory = j.at("memory").get<cc::mem_usage_in_KB_literal>();
}

void to_json(nlohmann::json & j, const PhaseResult & src)
{
	j = nlohmann::json {
		{"status", src.status},
		{"stdout", src.std_out},
		{"stderr", src.std_err},
		{"resource_usage", src.resource_usage},
	};
}

void from_json(const nlohmann::json & j, PhaseResult & dst)
{
	dst.status = j.at("status").get<int>();
	dst.std_out = j.at("stdout").get<std::string>();
	dst.std_err = j.at("stderr").get<std::string>();
	dst.resource_usage = j.at("resource_usage").get<ResourceUsage>();
}

void to_json(nlohmann::json & j, const BuildRunResult & src)
{
	j = nlohmann::json::object();
	optional_to_json(j, "build", src.build);
	j["run"] = src.run;
}

void from_json(const nlohmann::json & j, BuildRunResult & dst)
{
	optional_from_json(j, "build", dst.build);
	dst.run = j.at("run").get<PhaseResult>();
}

void to_json(nlohmann::json & j, const CheckResult & src)
{
	j = nlohmann::json::object();
	j["verdict"] = getVerdictName(src.verdict);
	optional_to_json(j, "reason", src.reason);
	optional_to_json(j, "compile", src.compile);
	optional_to_json(j, "run", src.run);
}

void from_json(const nlohmann::json & j, CheckResult & dst)
{
	dst.verdict = parseVerdictName(j.at("verdict").get<std::string>());
	optional_from_json(j, "reason", dst.reason);
	optional_from_json(j, "compile", dst.compile);
	optional_from_json(j, "run", dst.run);
}

void to_json(nlohmann::json & j, const Example & src)
{
	j = nlohmann::json {
		{"id", src.id},
		{"input", src.input},
		{"output", src.output},
	};
	optional_to_json(j, "explanation", src.explanation);
}

void from_json(const nlohmann::json & j, Example & dst)
{
	dst.id = j.at("id").get<std::string>();
	dst.input = j.at("input").get<std::string>();
	dst.output = j.at("output").get<std::string>();
	optional_from_json(j, "explanation", dst.explanation);
}

void to_json(nlohmann::json & j, const CheckOutcome & src)
{
	j = nlohmann::json::object();
	j["error"] = getCheckErrorKindName(src.kind);
	switch (src.kind) {
		case CheckErrorKind::TESTCASE_FAILED:
			j["details"] = {
				{"seed", src.seed},
				{"result", src.result},
			};
			break;
		case CheckErrorKind::EVALUATOR_FAILED:
		case CheckErrorKind::INVALID_OUTPUT:
			if (src.evaluator_result != nullopt) {
				j["details"] = *src.evaluator_result;
			}
			break;
		case CheckErrorKind::ENVIRONMENT_NOT_FOUND:
		case CheckErrorKind::LIMIT_EXCEEDED:
			j["details"] = src.message;
			break;
		case CheckErrorKind::SUCCESS:
		case CheckErrorKind::NO_EXAMPLES:
			break;
	}
}
