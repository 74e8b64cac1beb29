/**
 * @file block_padding.cpp
 * @brief Zero padding implementation
 */

#include "block_padding.hpp"

size_t paddedSize(size_t size, size_t block_size) {
    size_t remainder = size % block_size;
    if (remainder == 0) {
        return size;
    }
    return size + (block_size - remainder);
}

size_t padToBlock(std::vector<uint8_t>& data, size_t block_size) {
    size_t target = paddedSize(data.size(), block_size);
    size_t added = target - data.size();
    if (added > 0) {
        data.resize(target, 0x00);
    }
    return added;
}
