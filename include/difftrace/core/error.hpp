#pragma once

#include <stdexcept>
#include <string>

namespace difftrace::core {

    // A caller broke one of the index's progress invariants.
    class InvariantViolation : public std::logic_error {
      public:
        using std::logic_error::logic_error;
    };

    // A read, write or compaction named a point that is not >= the installed
    // compaction frontier. The history it would need has been discarded.
    class StaleVersionAccess : public InvariantViolation {
      public:
        StaleVersionAccess(const std::string &requested, const std::string &frontier)
            : InvariantViolation("Invalid version: " + requested + " is not beyond compaction frontier " + frontier),
              requested_(requested), frontier_(frontier) {}

        const std::string &requested() const noexcept { return requested_; }
        const std::string &frontier() const noexcept { return frontier_; }

      protected:
        StaleVersionAccess(const std::string &what, const std::string &requested, const std::string &frontier)
            : InvariantViolation(what), requested_(requested), frontier_(frontier) {}

      private:
        std::string requested_;
        std::string frontier_;
    };

    // compact() was handed a frontier behind the one already installed.
    class NonMonotonicCompaction : public StaleVersionAccess {
      public:
        NonMonotonicCompaction(const std::string &requested, const std::string &frontier)
            : StaleVersionAccess("Invalid compaction frontier: " + requested + " does not follow " + frontier,
                                 requested, frontier) {}
    };

} // namespace difftrace::core
