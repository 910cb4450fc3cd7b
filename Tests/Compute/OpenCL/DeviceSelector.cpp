/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "Ocelot.h"
#include "../FakeClDriver.h"

namespace Ocelot::Compute::Tests
{
    using namespace Ocelot::Compute;
    using namespace Ocelot::Compute::OpenCL;

    class DeviceSelectorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            driver_ = FakeClDriver::create( 2, 1 );
            devices_ = driver_->getFakeDevices();
        }

        Platform platform() const {
            return Platform( driver_, driver_->getPlatform() );
        }

        std::shared_ptr<FakeClDriver> driver_;
        std::vector<FakeClDriver::FakeDevice> devices_;
    };

    TEST_F( DeviceSelectorTest, First_PicksFirstDevice ) {
        auto devices = DeviceSelector::first().resolve( platform() );

        ASSERT_EQ( devices.size(), 1u );
        EXPECT_EQ( devices[ 0 ], devices_[ 0 ].id );
    }

    TEST_F( DeviceSelectorTest, All_PicksEveryDeviceInOrder ) {
        auto devices = DeviceSelector::all().resolve( platform() );

        ASSERT_EQ( devices.size(), 3u );
        EXPECT_EQ( devices[ 2 ], devices_[ 2 ].id );
    }

    TEST_F( DeviceSelectorTest, SingleAndList_AreTakenVerbatim ) {
        auto single = DeviceSelector::single( devices_[ 1 ].id ).resolve( platform() );
        auto list = DeviceSelector::list( { devices_[ 2 ].id, devices_[ 0 ].id } ).resolve( platform() );

        EXPECT_EQ( single, std::vector<cl_device_id>{ devices_[ 1 ].id } );
        EXPECT_EQ( list, ( std::vector<cl_device_id>{ devices_[ 2 ].id, devices_[ 0 ].id } ) );
        EXPECT_EQ( driver_->callCount( "clGetDeviceIDs" ), 0 );
    }

    TEST_F( DeviceSelectorTest, Indices_AreStrict ) {
        auto devices = DeviceSelector::indices( { 2, 0 } ).resolve( platform() );

        EXPECT_EQ( devices, ( std::vector<cl_device_id>{ devices_[ 2 ].id, devices_[ 0 ].id } ) );
        EXPECT_THROW( DeviceSelector::indices( { 3 } ).resolve( platform() ), ConfigurationError );
    }

    TEST_F( DeviceSelectorTest, WrappingIndices_WrapAround ) {
        auto devices = DeviceSelector::wrappingIndices( { 3, 4 } ).resolve( platform() );

        EXPECT_EQ( devices, ( std::vector<cl_device_id>{ devices_[ 0 ].id, devices_[ 1 ].id } ) );
    }

    TEST_F( DeviceSelectorTest, Type_FiltersByDeviceType ) {
        auto gpus = DeviceSelector::type( DeviceType::Gpu ).resolve( platform() );
        auto cpus = DeviceSelector::type( DeviceType::Cpu ).resolve( platform() );
        auto accelerators = DeviceSelector::type( DeviceType::Accelerator ).resolve( platform() );

        EXPECT_EQ( gpus.size(), 2u );
        EXPECT_EQ( cpus, std::vector<cl_device_id>{ devices_[ 2 ].id } );
        EXPECT_TRUE( accelerators.empty() );
    }

    TEST( DeviceSelector, EmptyPlatformResolvesToNothing ) {
        auto driver = FakeClDriver::create( 0 );
        Platform platform( driver, driver->getPlatform() );

        EXPECT_TRUE( DeviceSelector::first().resolve( platform ).empty() );
        EXPECT_TRUE( DeviceSelector::all().resolve( platform ).empty() );
        EXPECT_TRUE( DeviceSelector::wrappingIndices( { 1 } ).resolve( platform ).empty() );
        EXPECT_THROW( DeviceSelector::indices( { 0 } ).resolve( platform ), ConfigurationError );
    }

    TEST( DeviceSelector, ToString ) {
        EXPECT_EQ( DeviceSelector::first().toString(), "First" );
        EXPECT_EQ( DeviceSelector::all().toString(), "All" );
        EXPECT_EQ( DeviceSelector::single( nullptr ).toString(), "Single" );
        EXPECT_EQ( DeviceSelector::list( { nullptr, nullptr } ).toString(), "List(2)" );
        EXPECT_EQ( DeviceSelector::indices( { 1, 2 } ).toString(), "Indices[1, 2]" );
        EXPECT_EQ( DeviceSelector::wrappingIndices( { 5 } ).toString(), "WrappingIndices[5]" );
        EXPECT_EQ( DeviceSelector::type( DeviceType::Gpu ).toString(), "Type(Gpu)" );
    }

    TEST( DeviceType, Conversions ) {
        EXPECT_EQ( toClDeviceType( DeviceType::Gpu ), static_cast<cl_device_type>( CL_DEVICE_TYPE_GPU ) );
        EXPECT_EQ( toClDeviceType( DeviceType::All ), static_cast<cl_device_type>( CL_DEVICE_TYPE_ALL ) );
        EXPECT_EQ( deviceTypeToString( DeviceType::Accelerator ), "Accelerator" );
        EXPECT_EQ( toDeviceType( "Cpu" ), DeviceType::Cpu );
        EXPECT_THROW( toDeviceType( "Tpu" ), std::invalid_argument );
    }
}
