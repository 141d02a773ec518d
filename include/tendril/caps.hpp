#pragma once
#include <optional>
#include <string>
#include <sys/types.h>

namespace tendril {

struct Credentials {
  uid_t uid;
  gid_t gid;
};

// Resolved in the parent: getpwnam is not safe between fork and exec.
std::optional<Credentials> lookup_user(const std::string &name);

// Called in the forked child before exec.
bool drop_privileges(const Credentials &cred);

} // namespace tendril
