#pragma once

#include "publish_types.h"

#include <string>

namespace hoist {

// Pure transformation: validates names and assembles the dockerconfigjson
// payload for `credential`. No cluster access. Throws ConfigInvalid for names
// that are not DNS-1123 subdomains.
deployment_patch build_pull_secret_spec(registry_credential const &credential,
                                        std::string secret_name,
                                        std::string namespace_name);

// Strategic-merge patch for the deployment: imagePullSecrets by name and the
// container image. Contains no credential material.
std::string render_deployment_fragment(deployment_patch const &patch,
                                       publish_target const &image);

// kubernetes.io/dockerconfigjson Secret manifest. With reveal=false the data
// field is replaced by a placeholder.
std::string render_pull_secret(deployment_patch const &patch, bool reveal);

// lowercase alphanumerics, '-' and '.', alphanumeric at both ends, <= 253 chars
bool k8s_name_is_valid(std::string_view name);

}  // namespace hoist
