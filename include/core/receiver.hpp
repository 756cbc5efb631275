#pragma once

namespace prw {

// Downstream consumer of an operation's output. process() may block (backpressure).
template <typename T>
class Receiver {
public:
  virtual ~Receiver() = default;

  virtual void process(T element) = 0;
};

} // namespace prw
