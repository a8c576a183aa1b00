#pragma once

#include <string>

namespace turnkey {
namespace testing {
namespace responses {

// Run paused for two function calls; arguments arrive JSON-encoded
inline const std::string RUN_REQUIRES_ACTION = R"({
  "id": "run_abc",
  "object": "thread.run",
  "thread_id": "thread_123",
  "assistant_id": "asst_1",
  "status": "requires_action",
  "required_action": {
    "type": "submit_tool_outputs",
    "submit_tool_outputs": {
      "tool_calls": [
        {"id": "call_1", "type": "function",
         "function": {"name": "get_weather", "arguments": "{\"city\": \"Seattle\"}"}},
        {"id": "call_2", "type": "function",
         "function": {"name": "get_stock_price", "arguments": "{\"symbol\": \"msft\"}"}}
      ]
    }
  },
  "last_error": null
})";

// Tool call whose argument text is not JSON
inline const std::string RUN_MALFORMED_ARGUMENTS = R"({
  "id": "run_bad",
  "thread_id": "thread_123",
  "status": "requires_action",
  "required_action": {
    "submit_tool_outputs": {
      "tool_calls": [
        {"id": "call_9", "type": "function",
         "function": {"name": "get_weather", "arguments": "{city: Seattle"}}
      ]
    }
  }
})";

inline const std::string RUN_FAILED = R"({
  "id": "run_fail",
  "thread_id": "thread_123",
  "status": "failed",
  "last_error": {"code": "rate_limit_exceeded", "message": "Rate limit is exceeded. Try again in 20 seconds."}
})";

inline const std::string RUN_EXPIRED = R"({
  "id": "run_old",
  "thread_id": "thread_123",
  "status": "expired"
})";

inline const std::string RUN_UNKNOWN_STATUS = R"({
  "id": "run_odd",
  "thread_id": "thread_123",
  "status": "thinking_hard"
})";

// Newest first, as returned with order=desc
inline const std::string MESSAGE_LIST = R"({
  "object": "list",
  "data": [
    {"id": "msg_3", "role": "assistant", "content": [
      {"type": "text", "text": {"value": "It is 14C and cloudy in Seattle.", "annotations": []}}
    ]},
    {"id": "msg_2", "role": "user", "content": [
      {"type": "text", "text": {"value": "What's the weather in Seattle?", "annotations": []}},
      {"type": "image_url", "image_url": {"url": "https://example.com/sky.png"}}
    ]},
    {"id": "msg_1", "role": "assistant", "content": [
      {"type": "image_file", "image_file": {"file_id": "file_1"}}
    ]}
  ],
  "has_more": false
})";

inline const std::string ERROR_BODY = R"({
  "error": {"code": "invalid_request", "message": "No assistant found with id 'asst_x'."}
})";

inline const std::string VECTOR_STORE = R"({
  "id": "vs_1",
  "name": "DemoDocumentStore",
  "status": "completed",
  "file_counts": {"in_progress": 0, "completed": 3, "failed": 0}
})";

} // namespace responses
} // namespace testing
} // namespace turnkey
