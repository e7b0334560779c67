#include "memory.hh"
#include "fake_device.hh"

#include <gtest/gtest.h>
#include <fmt/format.h>

#include <array>
#include <cstring>
#include <vector>

using namespace rune;
using namespace rune::test;

namespace {
    class MemoryAllocatorTest : public ::testing::Test {
        protected:
            void SetUp() override { memory.init(device); }

            void TearDown() override {
                memory.destroy();
                EXPECT_TRUE(device.violations.empty()) << fmt::format("{}", fmt::join(device.violations, "\n"));
                EXPECT_EQ(device.live_objects(), 0u);
            }

            std::vector<std::byte> pattern(size_t n) {
                std::vector<std::byte> out(n);
                for( size_t i = 0; i < n; i++ ) { out[i] = std::byte((i * 7 + 3) & 0xff); }
                return out;
            }

            FakeDevice      device;
            MemoryAllocator memory;
    };
}

TEST_F(MemoryAllocatorTest, MappedUniformBufferRoundTrip) {
    AllocationUnit ubo = memory.allocate_buffer(
        256,
        vk::BufferUsageFlagBits::eUniformBuffer,
        vma::MemoryUsage::eCpuToGpu,
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
    );
    ASSERT_TRUE(ubo.is_buffer());
    EXPECT_EQ(ubo.buffer().size, 256u);

    std::vector<std::byte> bytes = pattern(256);
    std::memcpy(memory.map(ubo), bytes.data(), bytes.size());
    memory.unmap(ubo);

    std::vector<std::byte> read_back(256);
    std::memcpy(read_back.data(), memory.map(ubo), read_back.size());
    memory.unmap(ubo);
    EXPECT_EQ(read_back, bytes);

    memory.destroy(ubo);
}

TEST_F(MemoryAllocatorTest, MappingDeviceLocalMemoryFails) {
    AllocationUnit buffer = memory.allocate_buffer(
        64, vk::BufferUsageFlagBits::eStorageBuffer, vma::MemoryUsage::eGpuOnly, vk::MemoryPropertyFlagBits::eDeviceLocal
    );
    try {
        memory.map(buffer);
        FAIL() << "expected a throw";
    } catch( const Error& e ) {
        EXPECT_EQ(e.kind(), ErrorKind::eApiFailure);
    }
    memory.destroy(buffer);
}

TEST_F(MemoryAllocatorTest, DeviceAddressNeedsTheUsageFlag) {
    AllocationUnit addressed = memory.allocate_buffer(
        64, vk::BufferUsageFlagBits::eStorageBuffer | vk::BufferUsageFlagBits::eShaderDeviceAddress, vma::MemoryUsage::eGpuOnly
    );
    AllocationUnit plain = memory.allocate_buffer(64, vk::BufferUsageFlagBits::eStorageBuffer, vma::MemoryUsage::eGpuOnly);

    EXPECT_NE(memory.device_address(addressed), 0u);
    EXPECT_EQ(memory.device_address(addressed), addressed.buffer().address);
    try {
        memory.device_address(plain);
        FAIL() << "expected a throw";
    } catch( const Error& e ) {
        EXPECT_EQ(e.kind(), ErrorKind::eInvariantViolation);
    }

    memory.destroy(addressed);
    memory.destroy(plain);
}

TEST_F(MemoryAllocatorTest, WrongAccessorThrows) {
    AllocationUnit buffer = memory.allocate_buffer(16, vk::BufferUsageFlagBits::eUniformBuffer, vma::MemoryUsage::eCpuToGpu);
    AllocationUnit img    = memory.create_image(
        vk::Extent3D { 1, 1, 1 }, vk::Format::eR8Unorm, vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eColor
    );
    EXPECT_THROW(buffer.image(), Error);
    EXPECT_THROW(img.buffer(), Error);
    EXPECT_THROW(memory.device_address(img), Error);

    memory.destroy(buffer);
    memory.destroy(img);
}

TEST_F(MemoryAllocatorTest, BufferUploadGoesThroughStaging) {
    std::vector<std::byte> bytes = pattern(300);
    AllocationUnit vertices = memory.create_buffer_with_data(bytes, vk::BufferUsageFlagBits::eVertexBuffer);

    ASSERT_EQ(device.buffers.size(), 1u);
    EXPECT_EQ(device.buffers.at(id_of(vertices.buffer().handle)).bytes, bytes);
    EXPECT_TRUE(vertices.buffer().usage & vk::BufferUsageFlagBits::eTransferDst);
    EXPECT_EQ(device.submits.size(), 1u);
    EXPECT_EQ(memory.live_allocations(), 1u);

    memory.destroy(vertices);
}

TEST_F(MemoryAllocatorTest, OversizedBufferUploadIsRejected) {
    AllocationUnit small = memory.allocate_buffer(8, vk::BufferUsageFlagBits::eTransferDst, vma::MemoryUsage::eGpuOnly);
    std::vector<std::byte> bytes = pattern(16);
    try {
        memory.upload(small, bytes);
        FAIL() << "expected a throw";
    } catch( const Error& e ) {
        EXPECT_EQ(e.kind(), ErrorKind::eInvariantViolation);
    }
    EXPECT_TRUE(device.submits.empty());
    memory.destroy(small);
}

TEST_F(MemoryAllocatorTest, ImageUploadEndsShaderReadable) {
    std::vector<std::byte> texels = pattern(2 * 2 * 4);
    AllocationUnit texture = memory.create_image_with_data(
        texels, vk::Extent3D { 2, 2, 1 }, vk::Format::eR8G8B8A8Unorm,
        vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eColor
    );

    u64 id = id_of(texture.image().handle);
    EXPECT_EQ(device.images.at(id).bytes, texels);
    EXPECT_TRUE(device.images.at(id).usage & vk::ImageUsageFlagBits::eTransferDst);
    EXPECT_LT(device.find_event(fmt::format("barrier {} {} -> {}", id,
        vk::to_string(vk::ImageLayout::eTransferDstOptimal), vk::to_string(vk::ImageLayout::eShaderReadOnlyOptimal))), device.events.size());
    EXPECT_EQ(device.buffers.size(), 0u);

    ASSERT_EQ(device.image_copies.size(), 1u);
    const vk::BufferImageCopy& region = device.image_copies[0].region;
    EXPECT_EQ(device.image_copies[0].image, id);
    EXPECT_EQ(region.bufferOffset, 0u);
    EXPECT_EQ(region.imageOffset, (vk::Offset3D { 0, 0, 0 }));
    EXPECT_EQ(region.imageExtent, (vk::Extent3D { 2, 2, 1 }));
    EXPECT_EQ(region.imageSubresource.aspectMask, vk::ImageAspectFlags(vk::ImageAspectFlagBits::eColor));
    EXPECT_EQ(region.imageSubresource.mipLevel, 0u);
    EXPECT_TRUE(device.blits.empty());

    memory.destroy(texture);
}

TEST_F(MemoryAllocatorTest, DepthUploadUsesTheDepthAspect) {
    std::vector<std::byte> depth = pattern(4 * 4 * 4);
    AllocationUnit img = memory.create_image_with_data(
        depth, vk::Extent3D { 4, 4, 1 }, vk::Format::eD32Sfloat,
        vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eDepth
    );
    EXPECT_EQ(img.image().aspect, vk::ImageAspectFlags(vk::ImageAspectFlagBits::eDepth));

    ASSERT_EQ(device.image_copies.size(), 1u);
    EXPECT_EQ(device.image_copies[0].region.imageSubresource.aspectMask, vk::ImageAspectFlags(vk::ImageAspectFlagBits::eDepth));
    EXPECT_EQ(device.image_copies[0].region.imageExtent, (vk::Extent3D { 4, 4, 1 }));

    ASSERT_EQ(device.barriers.size(), 2u);
    for( const auto& barrier : device.barriers ) {
        EXPECT_EQ(barrier.aspect, vk::ImageAspectFlags(vk::ImageAspectFlagBits::eDepth));
    }
    EXPECT_EQ(device.barriers[0].to, vk::ImageLayout::eTransferDstOptimal);
    EXPECT_EQ(device.barriers[1].to, vk::ImageLayout::eShaderReadOnlyOptimal);

    memory.destroy(img);
}

TEST_F(MemoryAllocatorTest, MipmappedUploadBlitsEveryLevel) {
    std::vector<std::byte> texels = pattern(8 * 4 * 4);
    AllocationUnit texture = memory.create_image_with_data(
        texels, vk::Extent3D { 8, 4, 1 }, vk::Format::eR8G8B8A8Unorm,
        vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eColor, true
    );
    u64 id = id_of(texture.image().handle);
    ASSERT_EQ(texture.image().mip_levels, 4u);

    ASSERT_EQ(device.image_copies.size(), 1u);
    EXPECT_EQ(device.image_copies[0].region.imageSubresource.mipLevel, 0u);

    std::array<vk::Offset3D, 3> ends {{ { 4, 2, 1 }, { 2, 1, 1 }, { 1, 1, 1 } }};
    ASSERT_EQ(device.blits.size(), 3u);
    for( u32 i = 0; i < 3; i++ ) {
        const auto& blit = device.blits[i];
        EXPECT_EQ(blit.src, id);
        EXPECT_EQ(blit.dst, id);
        EXPECT_EQ(blit.region.srcSubresource.mipLevel, i);
        EXPECT_EQ(blit.region.dstSubresource.mipLevel, i + 1);
        EXPECT_EQ(blit.region.dstOffsets[1], ends[i]);
    }

    // Every level reaches ShaderReadOnly exactly once, one level at a time.
    std::array<u32, 4> readable {};
    for( const auto& barrier : device.barriers ) {
        if( barrier.to != vk::ImageLayout::eShaderReadOnlyOptimal ) { continue; }
        ASSERT_EQ(barrier.mip_levels, 1u);
        ASSERT_LT(barrier.base_mip, 4u);
        readable[barrier.base_mip]++;
    }
    EXPECT_EQ(readable, (std::array<u32, 4> { 1, 1, 1, 1 }));

    memory.destroy(texture);
}

TEST_F(MemoryAllocatorTest, MipmappedDepthUploadIsRejected) {
    std::vector<std::byte> depth = pattern(4 * 4 * 4);
    try {
        memory.create_image_with_data(
            depth, vk::Extent3D { 4, 4, 1 }, vk::Format::eD32Sfloat,
            vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eDepth, true
        );
        FAIL() << "expected a throw";
    } catch( const Error& e ) {
        EXPECT_EQ(e.kind(), ErrorKind::eInvariantViolation);
    }
    EXPECT_TRUE(device.submits.empty());
    EXPECT_EQ(memory.live_allocations(), 0u);
}

TEST_F(MemoryAllocatorTest, ShortImagePayloadIsRejected) {
    std::vector<std::byte> texels = pattern(15);
    EXPECT_THROW(memory.create_image_with_data(
        texels, vk::Extent3D { 2, 2, 1 }, vk::Format::eR8G8B8A8Unorm,
        vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eColor
    ), Error);
    EXPECT_EQ(memory.live_allocations(), 0u);
}

TEST_F(MemoryAllocatorTest, MipmappedImageGetsFullChain) {
    AllocationUnit img = memory.create_image(
        vk::Extent3D { 256, 64, 1 }, vk::Format::eR8G8B8A8Unorm,
        vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eColor, true
    );
    EXPECT_EQ(img.image().mip_levels, 9u);
    memory.destroy(img);
}

TEST_F(MemoryAllocatorTest, FailedAllocationReportsExhaustion) {
    device.buffer_results.push_back(vk::Result::eErrorOutOfDeviceMemory);
    try {
        memory.allocate_buffer(1 << 20, vk::BufferUsageFlagBits::eStorageBuffer, vma::MemoryUsage::eGpuOnly);
        FAIL() << "expected a throw";
    } catch( const Error& e ) {
        EXPECT_EQ(e.kind(), ErrorKind::eResourceExhausted);
    }
    EXPECT_EQ(memory.live_allocations(), 0u);
}

TEST_F(MemoryAllocatorTest, FailedViewReleasesTheImage) {
    device.view_results.push_back(vk::Result::eErrorOutOfHostMemory);
    EXPECT_THROW(memory.create_image(
        vk::Extent3D { 8, 8, 1 }, vk::Format::eR8G8B8A8Unorm,
        vk::ImageUsageFlagBits::eSampled, vk::ImageAspectFlagBits::eColor
    ), Error);
    EXPECT_TRUE(device.images.empty());
    EXPECT_EQ(memory.live_allocations(), 0u);
}
