#ifndef CONFINE_PRIVILEGES_H
#define CONFINE_PRIVILEGES_H

namespace confine {

// Empties the permitted, inheritable and effective capability sets and sets
// no-new-privileges. Irreversible. Aborts on failure.
void DropPrivileges();

}  // namespace confine

#endif  // CONFINE_PRIVILEGES_H
