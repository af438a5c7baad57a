#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace splash
{

class CallbackSink : public ILineSink
{
 public:
  using Callback = std::function<void(std::string_view)>;

  explicit CallbackSink(Callback cb);

  void Write(std::string_view line) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace splash
