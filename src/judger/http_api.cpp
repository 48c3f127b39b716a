/*
 * http_api.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "http_api.hpp"
#include "judge_exception.hpp"
#include "logger.hpp"

extern std::ofstream log_fp;

namespace
{
	/**
	 * @brief 请求本身不合法 (路径中的 id 不是 uuid, 请求体不是约定的 json)
	 */
	class BadRequestException: public JudgeException
	{
		public:
			using JudgeException::JudgeException;
	};

	template <typename IDType>
	IDType parse_id(const std::string & s)
	{
		try {
			return IDType(s);
		} catch (const std::runtime_error &) {
			throw BadRequestException("invalid id: " + s);
		}
	}

	nlohmann::json parse_body(const httplib::Request & req)
	{
		try {
			nlohmann::json body = nlohmann::json::parse(req.body);
			if (!body.is_object()) {
				throw BadRequestException("request body must be a json object");
			}
			return body;
		} catch (const nlohmann::json::exception & e) {
			throw BadRequestException(std::string("malformed request body: ") + e.what());
		}
	}

	void reply(httplib::Response & res, int status, const nlohmann::json & body)
	{
		res.status = status;
		res.set_content(body.dump(), "application/json");
	}

	void reply_error(httplib::Response & res, int status, const std::string & error, const nlohmann::json & details)
	{
		reply(res, status, nlohmann::json {
			{"error", error},
			{"details", details},
		});
	}

	void reply_outcome(httplib::Response & res, const CheckOutcome & outcome, const nlohmann::json & success_body)
	{
		if (outcome.passed()) {
			reply(res, 200, success_body);
		} else {
			reply(res, outcome_http_status(outcome), outcome);
		}
	}

	template <typename Handler>
	httplib::Server::Handler guarded(Handler handler)
	{
		return [handler](const httplib::Request & req, httplib::Response & res) {
			try {
				handler(req, res);
			} catch (const BadRequestException & e) {
				reply_error(res, 400, "BAD_REQUEST", e.what());
			} catch (const nlohmann::json::exception & e) {
				reply_error(res, 400, "BAD_REQUEST", e.what());
			} catch (const NotFoundException & e) {
				reply_error(res, 404, "NOT_FOUND", e.what());
			} catch (const EnvironmentNotFoundException & e) {
				reply_error(res, 404, getCheckErrorKindName(CheckErrorKind::ENVIRONMENT_NOT_FOUND), e.environment());
			} catch (const EvaluatorException & e) {
				EXCEPT_WARNING(log_kind::JUDGER, 0, log_fp, "Evaluator failed while serving request.", e, " path: ", req.path);
				reply_error(res, 400, getCheckErrorKindName(e.kind()), e.result());
			} catch (const ExampleGenerationFailedException & e) {
				EXCEPT_WARNING(log_kind::JUDGER, 0, log_fp, "Example generation failed.", e, " path: ", req.path);
				reply_error(res, 400, "EXAMPLE_GENERATION_FAILED", e.result());
			} catch (const std::exception & e) {
				EXCEPT_FATAL(log_kind::JUDGER, 0, log_fp, "Request failed.", e, " method: ", req.method, " path: ", req.path);
				reply_error(res, 500, "INTERNAL_ERROR", e.what());
			}
		};
	}
}

int outcome_http_status(const CheckOutcome & outcome) noexcept
{
	switch (outcome.kind) {
		case CheckErrorKind::SUCCESS:
			return 200;
		case CheckErrorKind::NO_EXAMPLES:
		case CheckErrorKind::ENVIRONMENT_NOT_FOUND:
			return 404;
		case CheckErrorKind::EVALUATOR_FAILED:
		case CheckErrorKind::INVALID_OUTPUT:
		case CheckErrorKind::TESTCASE_FAILED:
		case CheckErrorKind::LIMIT_EXCEEDED:
			return 400;
	}
	return 500;
}

Challenge parse_challenge_draft(const nlohmann::json & body)
{
	Challenge challenge;
	if (body.contains("creator")) {
		challenge.creator = parse_id<cc::user_id_type>(body.at("creator").get<std::string>());
	}
	challenge.description = body.value("description", "");
	challenge.time_limit = cc::time_in_milliseconds(body.at("time_limit").get<cc::time_literal>());
	challenge.memory_limit = cc::mem_in_MB(body.at("memory_limit").get<cc::mem_literal>());
	challenge.static_tests = body.at("static_tests").get<int>();
	challenge.random_tests = body.at("random_tests").get<int>();
	challenge.evaluator = body.at("evaluator").get<std::string>();
	challenge.solution_environment = body.at("solution_environment").get<std::string>();
	challenge.solution_code = body.at("solution_code").get<std::string>();
	challenge.xp = body.value("xp", cc::reward_literal(0));
	challenge.coins = body.value("coins", cc::reward_literal(0));
	return challenge;
}

ChallengePatch parse_challenge_patch(const nlohmann::json & body)
{
	ChallengePatch patch;
	if (body.contains("description")) {
		patch.description = body.at("description").get<std::string>();
	}
	if (body.contains("time_limit")) {
		patch.time_limit = cc::time_in_milliseconds(body.at("time_limit").get<cc::time_literal>());
	}
	if (body.contains("memory_limit")) {
		patch.memory_limit = cc::mem_in_MB(body.at("memory_limit").get<cc::mem_literal>());
	}
	if (body.contains("static_tests")) {
		patch.static_tests = body.at("static_tests").get<int>();
	}
	if (body.contains("random_tests")) {
		patch.random_tests = body.at("random_tests").get<int>();
	}
	if (body.contains("evaluator")) {
		patch.evaluator = body.at("evaluator").get<std::string>();
	}
	if (body.contains("solution_environment")) {
		patch.solution_environment = body.at("solution_environment").get<std::string>();
	}
	if (body.contains("solution_code")) {
		patch.solution_code = body.at("solution_code").get<std::string>();
	}
	if (body.contains("xp")) {
		patch.xp = body.at("xp").get<cc::reward_literal>();
	}
	if (body.contains("coins")) {
		patch.coins = body.at("coins").get<cc::reward_literal>();
	}
	return patch;
}

void register_routes(httplib::Server & server, JudgeService & service)
{
	server.Get("/queue", guarded([&service](const httplib::Request &, httplib::Response & res) {
		reply(res, 200, service.queue_status());
	}));

	server.Post("/challenges/validate", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		Challenge draft = parse_challenge_draft(parse_body(req));
		reply_outcome(res, service.validate_challenge(draft), nlohmann::json::object());
	}));

	server.Post("/challenges", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		nlohmann::json body = parse_body(req);
		if (!body.contains("creator")) {
			throw BadRequestException("creator is required");
		}
		ChallengeWriteResult result = service.create_challenge(parse_challenge_draft(body));
		reply_outcome(res, result.outcome, result.challenge);
	}));

	server.Patch(R"(/challenges/([0-9a-fA-F-]+))", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		cc::challenge_id_type challenge_id = parse_id<cc::challenge_id_type>(req.matches[1]);
		ChallengeWriteResult result = service.update_challenge(challenge_id, parse_challenge_patch(parse_body(req)));
		reply_outcome(res, result.outcome, result.challenge);
	}));

	server.Get(R"(/challenges/([0-9a-fA-F-]+)/examples)", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		cc::challenge_id_type challenge_id = parse_id<cc::challenge_id_type>(req.matches[1]);
		reply(res, 200, service.list_examples(challenge_id));
	}));

	server.Post(R"(/challenges/([0-9a-fA-F-]+)/examples/([^/]+)/test)", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		cc::challenge_id_type challenge_id = parse_id<cc::challenge_id_type>(req.matches[1]);
		std::string example_id = req.matches[2];
		nlohmann::json body = parse_body(req);
		CheckResult result = service.test_example(challenge_id, example_id,
													body.at("environment").get<std::string>(),
													body.at("code").get<std::string>());
		reply(res, 200, result);
	}));

	server.Post(R"(/challenges/([0-9a-fA-F-]+)/submissions)", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		cc::challenge_id_type challenge_id = parse_id<cc::challenge_id_type>(req.matches[1]);
		nlohmann::json body = parse_body(req);
		SubmitReceipt receipt = service.submit(challenge_id,
												parse_id<cc::user_id_type>(body.at("user_id").get<std::string>()),
												body.at("environment").get<std::string>(),
												body.at("code").get<std::string>());
		reply(res, 201, receipt);
	}));

	server.Get(R"(/challenges/([0-9a-fA-F-]+)/submissions)", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		cc::challenge_id_type challenge_id = parse_id<cc::challenge_id_type>(req.matches[1]);
		if (!req.has_param("user_id")) {
			throw BadRequestException("user_id is required");
		}
		cc::user_id_type user_id = parse_id<cc::user_id_type>(req.get_param_value("user_id"));
		reply(res, 200, service.list_submissions(challenge_id, user_id));
	}));

	server.Get(R"(/submissions/([0-9a-fA-F-]+))", guarded([&service](const httplib::Request & req, httplib::Response & res) {
		cc::submission_id_type submission_id = parse_id<cc::submission_id_type>(req.matches[1]);
		optional<SubmissionView> view = service.get_submission(submission_id);
		if (view == nullopt) {
			throw NotFoundException("submission not found: " + submission_id.to_string());
		}
		reply(res, 200, *view);
	}));
}
