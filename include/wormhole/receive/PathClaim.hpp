#pragma once

#include <filesystem>
#include <functional>

namespace wormhole::receive {

// symlink_status based, so a dangling link still counts as occupied.
bool path_occupied(const std::filesystem::path& path);

// Claims a working sibling of `destination`: "<destination>.tmp" first, then
// "<destination>.tmp-<random>". Occupied candidates are skipped without being
// touched. `try_create` must create the candidate exclusively and return
// false when it lost a race for the name. Throws filesystem_error(file_exists)
// once every attempt is taken.
std::filesystem::path claim_sibling(const std::filesystem::path& destination,
                                    const std::function<bool(const std::filesystem::path&)>& try_create);

// Throws TransferError when something appeared at `destination` after it was
// resolved. Called right before a rename, which would otherwise replace it.
void ensure_vacant(const std::filesystem::path& destination);

}  // namespace wormhole::receive
