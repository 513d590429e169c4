#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace mosdl {

  enum class interaction_pattern { send, submit, request, invoke, progress, pubsub };

  // Message-carrying stages of the MAL interaction patterns.
  enum class interaction_stage {
    send,
    submit,
    request,
    request_response,
    invoke,
    invoke_ack,
    invoke_response,
    progress,
    progress_ack,
    progress_update,
    progress_response,
    pubsub_publish,
  };

  // Lower-case keyword introducing an operation of this pattern.
  std::string_view
  pattern_keyword(interaction_pattern pattern);

  // Message stages of a pattern in the order they are exchanged.
  std::span<const interaction_stage>
  pattern_stages(interaction_pattern pattern);

  inline std::size_t
  message_count(interaction_pattern pattern) {
    return pattern_stages(pattern).size();
  }

  std::string_view
  stage_name(interaction_stage stage);

  // Documentation tag of a stage: the last underscore-separated part of its
  // name in lower case, e.g. "update" for PROGRESS_UPDATE.
  std::string_view
  stage_tag(interaction_stage stage);

} // namespace mosdl
