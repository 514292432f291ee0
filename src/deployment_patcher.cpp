#include "deployment_patcher.h"

#include "util.h"

#include <cctype>
#include <utility>

namespace hoist {

namespace {

constexpr size_t kMaxNameLength{ 253 };
constexpr char kRedacted[]{ "<redacted: rerun with --emit-secret>" };

void require_name(std::string_view name, std::string_view what) {
  if (!k8s_name_is_valid(name)) {
    throw publish_error::config_invalid(std::string{ what } + " '" + std::string{ name } +
                                        "' is not a valid Kubernetes object name");
  }
}

}  // namespace

bool k8s_name_is_valid(std::string_view name) {
  if (name.empty() || name.size() > kMaxNameLength) { return false; }

  auto const alnum{ [](char c) {
    auto const uc{ static_cast<unsigned char>(c) };
    return std::islower(uc) || std::isdigit(uc);
  } };

  if (!alnum(name.front()) || !alnum(name.back())) { return false; }
  for (char const c : name) {
    if (!alnum(c) && c != '-' && c != '.') { return false; }
  }
  return true;
}

deployment_patch build_pull_secret_spec(registry_credential const &credential,
                                        std::string secret_name,
                                        std::string namespace_name) {
  require_name(secret_name, "secret name");
  require_name(namespace_name, "namespace");

  auto const token{ credential.token.reveal() };
  std::string json{ "{\"auths\":{\"" };
  util_append_json_string(json, credential.server);
  json.append("\":{\"username\":\"");
  util_append_json_string(json, credential.username);
  json.append("\",\"password\":\"");
  util_append_json_string(json, token);
  json.append("\",\"email\":\"");
  util_append_json_string(json, credential.email);
  json.append("\",\"auth\":\"");
  json.append(util_base64_encode(credential.username + ":" + std::string{ token }));
  json.append("\"}}}");

  deployment_patch patch{ .secret_name = std::move(secret_name),
                          .namespace_name = std::move(namespace_name),
                          .image = std::nullopt,
                          .server = credential.server,
                          .docker_config_json = secret{ std::move(json) },
                          .deployment_name = {},
                          .container_name = {} };
  return patch;
}

std::string render_deployment_fragment(deployment_patch const &patch,
                                       publish_target const &image) {
  require_name(patch.deployment_name, "deployment name");
  require_name(patch.container_name, "container name");
  require_name(patch.secret_name, "secret name");
  require_name(patch.namespace_name, "namespace");

  std::string out;
  out.append("apiVersion: apps/v1\n");
  out.append("kind: Deployment\n");
  out.append("metadata:\n");
  out.append("  name: " + patch.deployment_name + "\n");
  out.append("  namespace: " + patch.namespace_name + "\n");
  out.append("spec:\n");
  out.append("  template:\n");
  out.append("    spec:\n");
  out.append("      imagePullSecrets:\n");
  out.append("        - name: " + patch.secret_name + "\n");
  out.append("      containers:\n");
  out.append("        - name: " + patch.container_name + "\n");
  out.append("          image: " + image.reference() + "\n");
  return out;
}

std::string render_pull_secret(deployment_patch const &patch, bool reveal) {
  require_name(patch.secret_name, "secret name");
  require_name(patch.namespace_name, "namespace");

  std::string out;
  out.append("apiVersion: v1\n");
  out.append("kind: Secret\n");
  out.append("metadata:\n");
  out.append("  name: " + patch.secret_name + "\n");
  out.append("  namespace: " + patch.namespace_name + "\n");
  out.append("type: kubernetes.io/dockerconfigjson\n");
  out.append("data:\n");
  out.append("  .dockerconfigjson: ");
  if (reveal) {
    out.append(util_base64_encode(patch.docker_config_json.reveal()));
  } else {
    out.push_back('"');
    out.append(kRedacted);
    out.push_back('"');
  }
  out.push_back('\n');
  return out;
}

}  // namespace hoist
