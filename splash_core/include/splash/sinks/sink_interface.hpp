#pragma once
#include <string_view>

namespace splash
{

class ILineSink
{
 public:
  virtual ~ILineSink() = default;

  // 写入一行已渲染的输出（不含换行符）
  virtual void Write(std::string_view line) = 0;

  // 刷新缓冲区
  virtual void Flush() = 0;
};

}  // namespace splash
