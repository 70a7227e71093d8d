#ifndef ACTIVE_TRANSACTION_H
#define ACTIVE_TRANSACTION_H

#include <mutex>
#include <string>

// Random (version 4) UUID in canonical text form
std::string generateUuid();

// The one transaction id every event refers to. A fresh id is minted on
// construction, so there is always exactly one.
class ActiveTransaction {
private:
  mutable std::mutex mutex_;
  std::string id_;
  unsigned long rotations_;

public:
  ActiveTransaction();
  explicit ActiveTransaction(const std::string& initial_id);

  std::string current() const;

  // Replace the id with a newly minted one and return it
  std::string rotate();

  unsigned long rotations() const;
};

#endif // ACTIVE_TRANSACTION_H
