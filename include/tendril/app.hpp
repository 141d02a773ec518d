#pragma once

namespace tendril {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace tendril
