#pragma once
#include <iostream>
#include <ostream>

namespace pkgtable {

class App {
public:
  explicit App(std::ostream &out = std::cout) : out_(out) {}

  // 0 ok, 1 operation failed, 2 usage error
  int run(int argc, char **argv);

private:
  std::ostream &out_;
};

} // namespace pkgtable
