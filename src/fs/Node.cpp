#include "fs/Node.hpp"
#include "fs/Error.hpp"

namespace pfs::fs {

namespace {
[[noreturn]] void unsupported(const char* op) {
    throw FsError(Errc::NotSupported, std::string(op) + " is not supported on this node");
}
}

std::shared_ptr<Node> Node::lookup(const std::string&) { unsupported("lookup"); }
std::vector<DirEntry> Node::readDirAll() { unsupported("readdir"); }
std::shared_ptr<Node> Node::mkdir(const std::string&) { unsupported("mkdir"); }
CreateResult Node::create(const std::string&) { unsupported("create"); }
void Node::remove(const std::string&) { unsupported("remove"); }
void Node::rmdir(const std::string&) { unsupported("rmdir"); }
void Node::rename(const std::string&, Node&, const std::string&) { unsupported("rename"); }
std::shared_ptr<Node> Node::symlink(const std::string&, const std::string&) { unsupported("symlink"); }
std::unique_ptr<Handle> Node::open(OpenIntent) { unsupported("open"); }
void Node::truncate(int64_t) { unsupported("truncate"); }
void Node::fsync() { unsupported("fsync"); }

std::string Handle::read(int64_t, std::size_t) { unsupported("read"); }
std::size_t Handle::write(int64_t, const char*, std::size_t) { unsupported("write"); }

}
