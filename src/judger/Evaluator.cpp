/*
 * Evaluator.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "Evaluator.hpp"
#include "judge_exception.hpp"

void to_json(nlohmann::json & j, const EvaluatorInput & src)
{
	j = nlohmann::json {
		{"input", src.input},
		{"data", src.data},
	};
}

void from_json(const nlohmann::json & j, EvaluatorInput & dst)
{
	dst.input = j.at("input").get<std::string>();
	dst.data = j.at("data");
}

Evaluator::Evaluator(Sandbox & sandbox, EvaluatorCache & cache, const EvaluatorRuntime & runtime,
						const std::string & source, const optional<std::string> & tag) :
		sandbox(sandbox), cache(cache), runtime(runtime), source(source), tag(tag)
{
}

BuildRunResult Evaluator::run(const std::vector<std::string> & args, const optional<std::string> & stdin_text)
{
	BuildRunRequest request;
	request.environment = runtime.environment;
	request.main_file = SandboxFile {runtime.main_file_name, source};
	request.files = runtime.library_files;
	request.args = args;
	request.stdin_text = stdin_text;

	BuildRunResult result;
	try {
		result = sandbox.build_and_run(request);
	} catch (const EnvironmentNotFoundException & e) {
		// 评测程序的环境来自配置, 找不到说明部署有误, 不能当作题目的问题
		throw SandboxException(std::string("evaluator environment is not available: ") + e.what());
	} catch (const CompileErrorException & e) {
		BuildRunResult failed;
		failed.build = e.build();
		failed.run = e.build();
		throw EvaluatorFailedException(failed);
	}

	if (result.run.status != 0) {
		throw EvaluatorFailedException(result);
	}
	return result;
}

template <typename Type>
Type Evaluator::parse_output(const BuildRunResult & result)
{
	try {
		return nlohmann::json::parse(result.run.std_out).get<Type>();
	} catch (const nlohmann::json::exception & e) {
		throw InvalidOutputException(e.what(), result);
	}
}

std::vector<std::string> Evaluator::examples()
{
	return this->cached<std::vector<std::string> >("examples", nlohmann::json::array(), [this]() {
		BuildRunResult result = this->run({"examples"}, nullopt);
		return this->parse_output<std::vector<std::string> >(result);
	});
}

EvaluatorInput Evaluator::generate(const std::string & seed)
{
	return this->cached<EvaluatorInput>("generate", nlohmann::json::array({seed}), [this, &seed]() {
		BuildRunResult result = this->run({"generate", seed}, nullopt);
		return this->parse_output<EvaluatorInput>(result);
	});
}

CheckResult Evaluator::check(const std::string & seed, const std::string & output, const nlohmann::json & data)
{
	return this->cached<CheckResult>("check", nlohmann::json::array({seed, output, data}), [this, &seed, &output, &data]() {
		nlohmann::json stdin_json = {
			{"output", output},
			{"data", data},
		};
		BuildRunResult result = this->run({"check", seed}, stdin_json.dump());
		nlohmann::json body = this->parse_output<nlohmann::json>(result);

		std::string verdict_name;
		CheckResult check_result;
		try {
			verdict_name = body.at("verdict").get<std::string>();
			auto reason = body.find("reason");
			if (reason != body.end() && !reason->is_null()) {
				check_result.reason = reason->get<std::string>();
			}
		} catch (const nlohmann::json::exception & e) {
			throw InvalidOutputException(e.what(), result);
		}

		if (verdict_name == "OK") {
			check_result.verdict = Verdict::OK;
		} else if (verdict_name == "WRONG_ANSWER" || verdict_name == "INVALID_OUTPUT_FORMAT") {
			check_result.verdict = Verdict::WRONG_ANSWER;
		} else {
			throw InvalidOutputException("unknown verdict " + verdict_name, result);
		}
		return check_result;
	});
}
