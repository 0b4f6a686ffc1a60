#include "Virtualization/vm/GuestAgent.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"
#include <libvirt/libvirt-qemu.h>
#include <cstdlib>

GuestAgent::GuestAgent(virDomainPtr dom, std::chrono::seconds t)
    : domain(dom), timeout(t) {}

std::string GuestAgent::buildCommand(const std::string& execute, const nlohmann::json& arguments) {
    nlohmann::json request = {{"execute", execute}};
    if (!arguments.is_null()) {
        request["arguments"] = arguments;
    }
    return request.dump();
}

nlohmann::json GuestAgent::parseReply(const std::string& raw) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception& e) {
        throw AgentCommandError(std::string("invalid guest agent reply: ") + e.what());
    }
    if (!root.is_object()) {
        throw AgentCommandError("guest agent reply is not a JSON object");
    }
    if (const auto error = root.find("error"); error != root.end()) {
        if (!error->is_object()) {
            throw AgentCommandError("guest agent error: " + error->dump());
        }
        const auto cls = error->find("class");
        const auto desc = error->find("desc");
        throw AgentCommandError((cls != error->end() && cls->is_string() ? cls->get<std::string>() : "GenericError") +
                                ": " +
                                (desc != error->end() && desc->is_string() ? desc->get<std::string>() : "no description"));
    }
    const auto ret = root.find("return");
    if (ret == root.end()) {
        throw AgentCommandError("guest agent reply has no 'return' member");
    }
    return *ret;
}

nlohmann::json GuestAgent::command(const std::string& execute, const nlohmann::json& arguments) {
    const auto request = buildCommand(execute, arguments);
    BoostLogger::Trace("Guest agent request: {}", request);

    char* reply = virDomainQemuAgentCommand(domain, request.c_str(), static_cast<int>(timeout.count()), 0);
    if (!reply) {
        throwLibvirtError("guest agent command " + execute, ErrorKind::AgentCommand);
    }
    std::string raw(reply);
    free(reply);
    return parseReply(raw);
}

int GuestAgent::countFromReply(const nlohmann::json& ret, const std::string& execute) {
    if (!ret.is_number_integer()) {
        throw AgentCommandError(execute + " returned " + ret.dump() + " instead of a count");
    }
    return ret.get<int>();
}

int GuestAgent::freeze() {
    return countFromReply(command("guest-fsfreeze-freeze"), "guest-fsfreeze-freeze");
}

int GuestAgent::thaw() {
    return countFromReply(command("guest-fsfreeze-thaw"), "guest-fsfreeze-thaw");
}

std::vector<VirtualMachineNic> GuestAgent::interfaces() {
    return VirtualMachineNic::fromAgentReply(command("guest-network-get-interfaces"));
}

FsFreezeGuard::FsFreezeGuard(GuestAgent& agent) : agent_(agent) {
    try {
        const int count = agent_.freeze();
        frozen_ = true;
        BoostLogger::Info("Guest filesystems frozen ({})", count);
    } catch (const std::exception& e) {
        failure_ = e.what();
        BoostLogger::Warn("Filesystem freeze failed: {}", failure_);
    }
}

FsFreezeGuard::~FsFreezeGuard() {
    // يحاول الإذابة دائمًا حتى لو فشل التجميد
    try {
        const int count = agent_.thaw();
        BoostLogger::Info("Guest filesystems thawed ({})", count);
    } catch (const LabException& e) {
        if (frozen_) {
            BoostLogger::Error("Filesystem thaw failed: {}", e.what());
        } else {
            BoostLogger::Debug("Thaw after failed freeze: {}", e.what());
        }
    } catch (const std::exception& e) {
        BoostLogger::Error("Filesystem thaw failed: {}", e.what());
    }
}
