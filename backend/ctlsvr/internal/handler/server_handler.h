#pragma once

#include <memory>

#include "../rpc/rpc_types.h"

namespace keyward::ctl {

class NodeStats;

/**
 * Server.* 只读节点信息，与凭证注册表无共享状态
 */
class ServerHandler {
public:
  explicit ServerHandler(std::shared_ptr<NodeStats> stats);

  MemStatsReply MemStats();
  SysInfoReply SysInfo();

private:
  std::shared_ptr<NodeStats> stats_;
};

} // namespace keyward::ctl
