#ifndef TOOLS__EXITER_HPP
#define TOOLS__EXITER_HPP

namespace tools
{
/// 监听 SIGINT/SIGTERM，进程内只允许一个实例
class Exiter
{
public:
  Exiter();

  bool exit() const;
};

}  // namespace tools

#endif  // TOOLS__EXITER_HPP
