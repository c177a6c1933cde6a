#include "cli/CommandFactory.hpp"

#include <utility>

namespace gitscribe {

CommandFactory& CommandFactory::instance() {
    static CommandFactory factory;
    return factory;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& [name, creator] : creators) {
        out.emplace_back(creator());
    }
}

}
