#pragma once

#include <string>

#include "snapshot/manager/core/v1/project.pb.h"
#include "snapshot/manager/core/v1/types.pb.h"

namespace snapshot::core {

/*
  Availability predicates.

  The caller's rights are asserted by the authorization layer in front
  of the service; these functions only decide whether a project/sandbox
  in its current state admits the request. "special" implies "execute".
*/
struct Rights {
  bool read    = false;
  bool write   = false;
  bool execute = false;
  bool special = false;

  static Rights Of(const snapshot::manager::core::v1::Caller& caller);
  static Rights All();
};

bool CanSchedule(const snapshot::manager::core::v1::ProjectRecord& project, const snapshot::manager::core::v1::SandboxRecord& sandbox, const Rights& rights);
bool CanRead(const snapshot::manager::core::v1::SandboxRecord& sandbox, const Rights& rights);
bool CanMutate(const snapshot::manager::core::v1::SandboxRecord& sandbox, const Rights& rights);
bool CanCreateSandbox(const snapshot::manager::core::v1::ProjectRecord& project, const Rights& rights);

// Throw util::NotAvailable when the predicate fails.
void RequireSchedulable(const snapshot::manager::core::v1::ProjectRecord& project, const snapshot::manager::core::v1::SandboxRecord& sandbox,
                        const Rights& rights);
void RequireReadable(const snapshot::manager::core::v1::SandboxRecord& sandbox, const Rights& rights);
void RequireMutable(const snapshot::manager::core::v1::SandboxRecord& sandbox, const Rights& rights);
void RequireSandboxCreation(const snapshot::manager::core::v1::ProjectRecord& project, const Rights& rights);

} // namespace snapshot::core
