#include <mosdl/interaction.hpp>

#include <array>
#include <cctype>
#include <string>
#include <unordered_map>

namespace mosdl {

  namespace {

    constexpr std::array send_stages{interaction_stage::send};
    constexpr std::array submit_stages{interaction_stage::submit};
    constexpr std::array request_stages{interaction_stage::request,
                                        interaction_stage::request_response};
    constexpr std::array invoke_stages{interaction_stage::invoke,
                                       interaction_stage::invoke_ack,
                                       interaction_stage::invoke_response};
    constexpr std::array progress_stages{
        interaction_stage::progress, interaction_stage::progress_ack,
        interaction_stage::progress_update,
        interaction_stage::progress_response};
    constexpr std::array pubsub_stages{interaction_stage::pubsub_publish};

    const std::unordered_map<interaction_stage, std::string>&
    stage_tags() {
      static const std::unordered_map<interaction_stage, std::string> tags = [] {
        std::unordered_map<interaction_stage, std::string> map;
        for (auto stage :
             {interaction_stage::send, interaction_stage::submit,
              interaction_stage::request, interaction_stage::request_response,
              interaction_stage::invoke, interaction_stage::invoke_ack,
              interaction_stage::invoke_response, interaction_stage::progress,
              interaction_stage::progress_ack,
              interaction_stage::progress_update,
              interaction_stage::progress_response,
              interaction_stage::pubsub_publish}) {
          auto name = stage_name(stage);
          auto sep = name.rfind('_');
          auto last = sep == std::string_view::npos ? name
                                                    : name.substr(sep + 1);
          std::string tag;
          for (char c : last)
            tag += static_cast<char>(
                std::tolower(static_cast<unsigned char>(c)));
          map.emplace(stage, std::move(tag));
        }
        return map;
      }();
      return tags;
    }

  } // namespace

  std::string_view
  pattern_keyword(interaction_pattern pattern) {
    switch (pattern) {
      case interaction_pattern::send: return "send";
      case interaction_pattern::submit: return "submit";
      case interaction_pattern::request: return "request";
      case interaction_pattern::invoke: return "invoke";
      case interaction_pattern::progress: return "progress";
      case interaction_pattern::pubsub: return "pubsub";
    }
    return "";
  }

  std::span<const interaction_stage>
  pattern_stages(interaction_pattern pattern) {
    switch (pattern) {
      case interaction_pattern::send: return send_stages;
      case interaction_pattern::submit: return submit_stages;
      case interaction_pattern::request: return request_stages;
      case interaction_pattern::invoke: return invoke_stages;
      case interaction_pattern::progress: return progress_stages;
      case interaction_pattern::pubsub: return pubsub_stages;
    }
    return {};
  }

  std::string_view
  stage_name(interaction_stage stage) {
    switch (stage) {
      case interaction_stage::send: return "SEND";
      case interaction_stage::submit: return "SUBMIT";
      case interaction_stage::request: return "REQUEST";
      case interaction_stage::request_response: return "REQUEST_RESPONSE";
      case interaction_stage::invoke: return "INVOKE";
      case interaction_stage::invoke_ack: return "INVOKE_ACK";
      case interaction_stage::invoke_response: return "INVOKE_RESPONSE";
      case interaction_stage::progress: return "PROGRESS";
      case interaction_stage::progress_ack: return "PROGRESS_ACK";
      case interaction_stage::progress_update: return "PROGRESS_UPDATE";
      case interaction_stage::progress_response: return "PROGRESS_RESPONSE";
      case interaction_stage::pubsub_publish: return "PUBSUB_PUBLISH";
    }
    return "";
  }

  std::string_view
  stage_tag(interaction_stage stage) {
    return stage_tags().at(stage);
  }

} // namespace mosdl
