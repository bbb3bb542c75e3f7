#include "keystone/realms.hpp"

#include <algorithm>
#include <cctype>

#include "keystone/hash.hpp"
#include "keystone/jsonlite.hpp"

namespace keystone {
namespace realms {

using jsonlite::get_string;
using jsonlite::make_string;
using jsonlite::make_u64;

namespace {

struct ContentTypeRule {
  const char* extension;
  const char* content_type;
};

constexpr ContentTypeRule kContentTypes[] = {
    {".txt", "text/plain"},       {".md", "text/markdown"},
    {".csv", "text/csv"},         {".json", "application/json"},
    {".pdf", "application/pdf"},  {".html", "text/html"},
    {".xml", "application/xml"},  {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
};

std::string guess_content_type(const std::string& file_name) {
  const auto dot = file_name.rfind('.');
  if (dot == std::string::npos) return "application/octet-stream";
  std::string ext = file_name.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& r : kContentTypes) {
    if (ext == r.extension) return r.content_type;
  }
  return "application/octet-stream";
}

StepResult validate_upload(const StepContext& ctx) {
  const auto& p = ctx.intent.parameters;
  const std::string file_name = get_string(p, "file_name");
  if (file_name.empty()) return StepResult::failure("file_name is required");
  if (file_name.find('/') != std::string::npos) {
    return StepResult::failure("file_name must not contain '/'");
  }
  const std::string content = get_string(p, "content");
  if (content.size() > kMaxInlineContentBytes) {
    return StepResult::failure("content exceeds inline limit");
  }
  jsonlite::Object out;
  out["file_name"] = make_string(file_name);
  out["size_bytes"] = make_u64(content.size());
  return StepResult::success(std::move(out));
}

StepResult store_blob(const StepContext& ctx) {
  const std::string content = get_string(ctx.intent.parameters, "content");
  jsonlite::Object out;
  out["file_reference"] =
      make_string("blob:" + ctx.context.tenant_id + ":" + blake3_hex(content));
  out["size_bytes"] = make_u64(content.size());
  return StepResult::success(std::move(out));
}

StepResult release_blob(const StepContext& ctx) {
  jsonlite::Object out;
  auto it = ctx.prior_outputs.find(ctx.step_name);
  out["released"] = make_string(it == ctx.prior_outputs.end()
                                    ? std::string()
                                    : get_string(it->second, "file_reference"));
  return StepResult::success(std::move(out));
}

StepResult extract_metadata(const StepContext& ctx) {
  const auto& p = ctx.intent.parameters;
  const std::string file_name = get_string(p, "file_name");
  const std::string content = get_string(p, "content");
  std::string content_type = get_string(p, "content_type");
  if (content_type.empty()) content_type = guess_content_type(file_name);

  uint64_t lines = content.empty() ? 0 : 1;
  for (char c : content) {
    if (c == '\n') ++lines;
  }
  if (!content.empty() && content.back() == '\n') --lines;

  jsonlite::Object out;
  out["file_name"] = make_string(file_name);
  out["content_type"] = make_string(content_type);
  out["line_count"] = make_u64(lines);
  out["byte_count"] = make_u64(content.size());
  out["locale"] = make_string(ctx.context.locale);
  return StepResult::success(std::move(out));
}

StepResult register_file(const StepContext& ctx) {
  auto blob = ctx.prior_outputs.find("store_blob");
  auto meta = ctx.prior_outputs.find("extract_metadata");
  if (blob == ctx.prior_outputs.end() || meta == ctx.prior_outputs.end()) {
    return StepResult::failure("register requires store_blob and extract_metadata outputs");
  }
  const std::string reference = get_string(blob->second, "file_reference");
  jsonlite::Object out;
  out["file_id"] = make_string("file_" + hash_domain("id:", reference).substr(0, 24));
  out["file_reference"] = make_string(reference);
  out["metadata"] = jsonlite::make_object(meta->second);
  out["session_id"] = make_string(ctx.context.session_id);
  out["user_id"] = make_string(ctx.context.user_id);
  return StepResult::success(std::move(out));
}

StepResult echo(const StepContext& ctx) {
  jsonlite::Object out;
  out["echo"] = jsonlite::make_object(ctx.intent.parameters);
  out["tenant_id"] = make_string(ctx.context.tenant_id);
  out["session_id"] = make_string(ctx.context.session_id);
  return StepResult::success(std::move(out));
}

}  // namespace

Capability ingest_file_capability() {
  Capability cap;
  cap.realm_name = kContentRealm;

  StepSpec validate{"validate", validate_upload, std::nullopt, true, 1, 0};
  StepSpec blob{"store_blob", store_blob, StepHandler(release_blob), true, 3, 0};
  StepSpec metadata{"extract_metadata", extract_metadata, std::nullopt, true, 3, 0};
  StepSpec reg{"register", register_file, std::nullopt, false, 1, 0};

  cap.stages.push_back({validate});
  cap.stages.push_back({blob, metadata});
  cap.stages.push_back({reg});
  return cap;
}

Capability save_materialization_capability(std::shared_ptr<MaterializationAuthorizer> authorizer) {
  Capability cap;
  cap.realm_name = kContentRealm;

  StepHandler materialize = [authorizer](const StepContext& ctx) {
    const auto& p = ctx.intent.parameters;
    const std::string contract_id = get_string(p, "contract_id");
    const std::string rep_type = get_string(p, "representation_type");
    if (contract_id.empty() || rep_type.empty()) {
      return StepResult::failure("contract_id and representation_type are required");
    }
    ContractScope requester;
    requester.user_id = ctx.context.user_id;
    requester.session_id = ctx.context.session_id;
    requester.solution_id = ctx.context.solution_id;

    Error e;
    auto rec = authorizer->materialize(ctx.context.tenant_id, contract_id, rep_type, requester,
                                       ctx.context.solution_id, &e);
    if (!rec) {
      StepResult r = StepResult::failure(e.message, e.code == ErrorCode::transient_infra);
      r.error_code = e.code == ErrorCode::transient_infra ? ErrorCode::step_execution_error : e.code;
      return r;
    }
    return StepResult::success(materialization_to_json(*rec));
  };

  cap.stages.push_back({StepSpec{"materialize", materialize, std::nullopt, false, 1, 0}});
  return cap;
}

Capability echo_capability() {
  Capability cap;
  cap.realm_name = kContentRealm;
  cap.stages.push_back({StepSpec{"echo", echo, std::nullopt, true, 2, 0}});
  return cap;
}

Error register_content_realm(CapabilityRouter& router,
                             std::shared_ptr<MaterializationAuthorizer> authorizer) {
  Error e = router.register_capability(IntentType::ingest_file, ingest_file_capability());
  if (!e.ok()) return e;
  e = router.register_capability(IntentType::save_materialization,
                                 save_materialization_capability(std::move(authorizer)));
  if (!e.ok()) return e;
  return router.register_capability(IntentType::echo, echo_capability());
}

}  // namespace realms
}  // namespace keystone
