#include "tendril/caps.hpp"
#include <grp.h>
#include <pwd.h>
#include <string>
#include <sys/prctl.h>
#include <unistd.h>
#include <vector>

namespace tendril {

std::optional<Credentials> lookup_user(const std::string &name) {
  std::vector<char> buf(16384);
  struct passwd pw {};
  struct passwd *res = nullptr;
  if (getpwnam_r(name.c_str(), &pw, buf.data(), buf.size(), &res) != 0 || !res)
    return std::nullopt;
  return Credentials{pw.pw_uid, pw.pw_gid};
}

bool drop_privileges(const Credentials &cred) {
  prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
  if (cred.uid == getuid() && cred.gid == getgid())
    return true;

  if (setgroups(1, &cred.gid) != 0)
    return false;
  if (setgid(cred.gid) != 0)
    return false;
  if (setuid(cred.uid) != 0)
    return false;
  return true;
}

} // namespace tendril
