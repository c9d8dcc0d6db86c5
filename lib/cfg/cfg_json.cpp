// cfgc/cfg/cfg_json.cpp - JSON form of a pruned program
#include "cfgc/cfg/cfg_json.hpp"

#include <string>
#include <utility>
#include <vector>

namespace cfgc
{

using json = nlohmann::json;

namespace
{

json target_to_json(const Cfg & cfg, BlockId target)
{
  if (!target.is_valid() || !cfg.block(target).is_alive()) {
    return nullptr;
  }
  return cfg.label(target);
}

json block_to_json(const Cfg & cfg, BlockId id)
{
  const Block & b = cfg.block(id);
  json j;
  j["label"] = cfg.label(id);
  j["text"] = join_fragments(b.fragments);
  j["then"] = target_to_json(cfg, b.then_target);
  j["else"] = target_to_json(cfg, b.else_target);
  j["loop_end"] = target_to_json(cfg, b.loop_exit);
  j["predecessors"] = cfg.sorted_labels(b.preds);
  j["successors"] = cfg.sorted_labels(b.succs);
  return j;
}

std::string concat(const std::vector<std::string> & tokens)
{
  std::string out;
  for (const auto & t : tokens) {
    out += t;
  }
  return out;
}

}  // namespace

json to_json(const Cfg & cfg)
{
  json j;
  j["name"] = cfg.name();
  j["ret_type"] = concat(cfg.return_type);
  j["args"] = concat(cfg.params);

  json blocks = json::array();
  blocks.push_back(block_to_json(cfg, cfg.entry()));
  for (const BlockId id : cfg.numbered_blocks()) {
    if (cfg.block(id).is_alive()) {
      blocks.push_back(block_to_json(cfg, id));
    }
  }
  blocks.push_back(block_to_json(cfg, cfg.exit()));
  j["blocks"] = std::move(blocks);
  return j;
}

json to_json(const Program & program, std::string_view input_name)
{
  json out;
  out["program"] = std::string(input_name);
  out["globals"] = join_fragments(program.globals.fragments);
  out["functions"] = json::array();
  for (const auto & cfg : program.functions) {
    out["functions"].push_back(to_json(cfg));
  }
  return out;
}

}  // namespace cfgc
