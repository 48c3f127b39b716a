/*
 * http_api.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_HTTP_API_HPP_
#define SRC_JUDGER_HTTP_API_HPP_

#include "JudgeService.hpp"

#include <httplib.h>

/**
 * @brief 在 server 上注册评测服务的全部路由
 *
 * | 方法 | 路径 | 操作 |
 * | GET | /queue | queue_status |
 * | POST | /challenges/validate | validate_challenge |
 * | POST | /challenges | create_challenge |
 * | PATCH | /challenges/{id} | update_challenge |
 * | GET | /challenges/{id}/examples | list_examples |
 * | POST | /challenges/{id}/examples/{example}/test | test_example |
 * | POST | /challenges/{id}/submissions | submit |
 * | GET | /challenges/{id}/submissions?user_id= | list_submissions |
 * | GET | /submissions/{id} | get_submission |
 *
 * 请求体与响应体均为 json. 出错时响应体形如 {"error": ..., "details": ...}
 */
void register_routes(httplib::Server & server, JudgeService & service);

/**
 * @brief 校验结论对应的 HTTP 状态码
 */
int outcome_http_status(const CheckOutcome & outcome) noexcept;

/**
 * @brief 由请求体构造题目草稿, 缺少必需字段时抛出 nlohmann::json::exception
 */
Challenge parse_challenge_draft(const nlohmann::json & body);

ChallengePatch parse_challenge_patch(const nlohmann::json & body);

#endif /* SRC_JUDGER_HTTP_API_HPP_ */
