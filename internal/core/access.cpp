#include "access.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::core {

using namespace snapshot::manager::core::v1;

Rights Rights::Of(const Caller& caller) {
  Rights rights;
  for (auto right : caller.rights()) {
    switch (right) {
      case RIGHT_READ:
        rights.read = true;
        break;
      case RIGHT_WRITE:
        rights.write = true;
        break;
      case RIGHT_EXECUTE:
        rights.execute = true;
        break;
      case RIGHT_SPECIAL:
        rights.special = true;
        rights.execute = true;
        break;
      default:
        break;
    }
  }
  return rights;
}

Rights Rights::All() {
  return Rights{true, true, true, true};
}

bool CanSchedule(const ProjectRecord& project, const SandboxRecord& sandbox, const Rights& rights) {
  if (project.state() != PROJECT_STATE_ACTIVE || !rights.execute) {
    return false;
  }
  return sandbox.state() == SANDBOX_STATE_ACTIVE || (sandbox.state() == SANDBOX_STATE_SECURED && rights.special);
}

bool CanRead(const SandboxRecord& sandbox, const Rights& rights) {
  if (model::IsSpecialRightRequired(sandbox.state())) {
    return rights.special;
  }
  return rights.read || rights.execute || rights.special;
}

bool CanMutate(const SandboxRecord& sandbox, const Rights& rights) {
  return CanRead(sandbox, rights) && (rights.write || rights.special);
}

bool CanCreateSandbox(const ProjectRecord& project, const Rights& rights) {
  return project.state() == PROJECT_STATE_ACTIVE && (rights.write || rights.special);
}

void RequireSchedulable(const ProjectRecord& project, const SandboxRecord& sandbox, const Rights& rights) {
  if (!CanSchedule(project, sandbox, rights)) {
    throw util::NotAvailable("sandbox " + sandbox.id() + " of project " + project.id() + " does not accept jobs");
  }
}

void RequireReadable(const SandboxRecord& sandbox, const Rights& rights) {
  if (!CanRead(sandbox, rights)) {
    throw util::NotAvailable("sandbox " + sandbox.id() + " is not readable");
  }
}

void RequireMutable(const SandboxRecord& sandbox, const Rights& rights) {
  if (!CanMutate(sandbox, rights)) {
    throw util::NotAvailable("sandbox " + sandbox.id() + " is not writable");
  }
}

void RequireSandboxCreation(const ProjectRecord& project, const Rights& rights) {
  if (!CanCreateSandbox(project, rights)) {
    throw util::NotAvailable("project " + project.id() + " does not accept new sandboxes");
  }
}

} // namespace snapshot::core
