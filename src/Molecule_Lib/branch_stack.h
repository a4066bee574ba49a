#ifndef MOLECULE_LIB_BRANCH_STACK_H_
#define MOLECULE_LIB_BRANCH_STACK_H_

#include <vector>

#include "Molecule_Lib/iwmtypes.h"

namespace smigraph {

// The atoms that open parenthesised branches. The top of the stack is
// the atom the current branch hangs from. Holds atom numbers only.

class BranchStack {
  private:
    std::vector<atom_number_t> _stack;

    // The deepest nesting seen.
    int _max_depth;

  public:
    BranchStack() : _max_depth(0) {}

    void clear() {
      _stack.clear();
      _max_depth = 0;
    }

    int empty() const { return _stack.empty();}
    int depth() const { return static_cast<int>(_stack.size());}
    int max_depth() const { return _max_depth;}

    void push(atom_number_t a) {
      _stack.push_back(a);
      if (depth() > _max_depth)
        _max_depth = depth();
    }

    // Returns 0 if the stack is empty.
    int pop(atom_number_t & a) {
      if (_stack.empty())
        return 0;

      a = _stack.back();
      _stack.pop_back();

      return 1;
    }

    atom_number_t top() const {
      if (_stack.empty())
        return kInvalidAtomNumber;

      return _stack.back();
    }
};

}  // namespace smigraph

#endif  // MOLECULE_LIB_BRANCH_STACK_H_
