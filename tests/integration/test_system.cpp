#include "TestHelper.hpp"
#include "fmodpp/Fmodpp.hpp"

#include <string>
#include <vector>

using namespace fmodpp;

class SystemTest : public test::MockRuntimeTest {
protected:
    void TearDown() override {
        // A failed test must not leave the single-system guard engaged
        EXPECT_EQ(detail::live_system_count(), 0);
        test::MockRuntimeTest::TearDown();
    }
};

TEST_F(SystemTest, CreateAndReleaseExactlyOnce) {
    FMOD_SYSTEM* raw = nullptr;
    {
        auto system = System::create();
        ASSERT_TRUE(system.has_value());
        raw = system->as_raw();
        EXPECT_EQ(raw, mock::state().last_system);
        EXPECT_EQ(detail::live_system_count(), 1);
    }
    EXPECT_EQ(mock::release_count(raw), 1);
    EXPECT_EQ(detail::live_system_count(), 0);
}

TEST_F(SystemTest, ReleaseIsSafeFromDestructors) {
    static_assert(noexcept(System::raw_release(nullptr)));

    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    FMOD_SYSTEM* raw = system->as_raw();
    EXPECT_EQ(System::raw_release(std::move(*system).leak()), FMOD_OK);
    EXPECT_EQ(mock::release_count(raw), 1);
    EXPECT_EQ(detail::live_system_count(), 0);
}

TEST_F(SystemTest, FailedCreationYieldsNoHandle) {
    mock::state().create_result = FMOD_ERR_MEMORY;
    auto system = System::create();
    ASSERT_FALSE(system.has_value());
    EXPECT_EQ(system.error().code(), FMOD_ERR_MEMORY);
    EXPECT_EQ(system.error().kind(), ErrorKind::Resource);
    EXPECT_TRUE(mock::state().release_calls.empty());
    EXPECT_EQ(detail::live_system_count(), 0);
}

TEST_F(SystemTest, OnlyOneSystemAtATime) {
    auto first = System::create();
    ASSERT_TRUE(first.has_value());

    auto second = System::create();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code(), FMOD_ERR_INITIALIZED);
    EXPECT_EQ(mock::state().create_calls, 1);
    EXPECT_TRUE(test::log_contains(test::drain_log(), "already alive"));

    auto extra = System::create_unchecked();
    ASSERT_TRUE(extra.has_value());
    EXPECT_EQ(detail::live_system_count(), 2);
}

TEST_F(SystemTest, CreateSucceedsAgainAfterRelease) {
    {
        auto first = System::create();
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(std::move(*first).try_release().has_value());
    }
    auto second = System::create();
    EXPECT_TRUE(second.has_value());
}

TEST_F(SystemTest, IncompatibleRuntimeIsRejectedAndReleased) {
    mock::state().runtime_version = HEADER_VERSION.into_raw() + 0x100;  // Next major release
    auto system = System::create();
    ASSERT_FALSE(system.has_value());
    EXPECT_EQ(system.error().code(), FMOD_ERR_HEADER_MISMATCH);
    EXPECT_EQ(mock::release_count(mock::state().last_system), 1);
    EXPECT_TRUE(test::log_contains(test::drain_log(), "not compatible"));
}

TEST_F(SystemTest, NewerMinorRuntimeIsAccepted) {
    mock::state().runtime_version = HEADER_VERSION.into_raw() + 1;
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    auto version = (*system)->version();
    ASSERT_TRUE(version.has_value());
    EXPECT_TRUE(version->is_compatible_with(HEADER_VERSION));
}

TEST_F(SystemTest, LeakedSystemIsNotReleasedUntilReclaimed) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    FMOD_SYSTEM* expected = system->as_raw();

    FMOD_SYSTEM* leaked = std::move(*system).leak();
    EXPECT_EQ(leaked, expected);
    EXPECT_EQ(mock::release_count(leaked), 0);

    // Reclaim so the process-wide guard is released
    {
        Handle<System> reclaimed = Handle<System>::unleak(System::from_raw(leaked));
    }
    EXPECT_EQ(mock::release_count(leaked), 1);
}

TEST_F(SystemTest, ConfigureAppliesSettingsThenInit) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());

    SystemConfig config;
    config.max_channels = 64;
    config.init_flags = FMOD_INIT_3D_RIGHTHANDED;
    config.output_type = FMOD_OUTPUTTYPE_NOSOUND;
    config.software_channels = 48;
    config.sample_rate = 44100;
    config.dsp_buffer_length = 512;
    ASSERT_TRUE((*system)->configure(config).has_value());

    const mock::NativeState& state = mock::state();
    EXPECT_EQ(state.output, FMOD_OUTPUTTYPE_NOSOUND);
    EXPECT_EQ(state.software_channels, 48);
    EXPECT_EQ(state.sample_rate, 44100);
    EXPECT_EQ(state.speaker_mode, FMOD_SPEAKERMODE_DEFAULT);
    EXPECT_EQ(state.dsp_buffer_length, 512u);
    EXPECT_EQ(state.dsp_buffer_count, 4);
    EXPECT_EQ(state.init_calls, 1);
    EXPECT_EQ(state.init_max_channels, 64);
    EXPECT_EQ(state.init_flags, static_cast<FMOD_INITFLAGS>(FMOD_INIT_3D_RIGHTHANDED));
}

TEST_F(SystemTest, ConfigureLeavesUnsetSettingsAlone) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());

    ASSERT_TRUE((*system)->configure(SystemConfig{}).has_value());
    EXPECT_EQ(mock::state().sample_rate, 0);
    EXPECT_EQ(mock::state().dsp_buffer_length, 0u);
    EXPECT_EQ(mock::state().init_max_channels, 512);
}

TEST_F(SystemTest, InitFailurePropagates) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());

    mock::state().init_result = FMOD_ERR_OUTPUT_INIT;
    auto result = (*system)->init(32);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), ErrorKind::Unavailable);
}

TEST_F(SystemTest, UpdateAndClose) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    ASSERT_TRUE((*system)->update().has_value());
    ASSERT_TRUE((*system)->update().has_value());
    ASSERT_TRUE((*system)->close().has_value());
    EXPECT_EQ(mock::state().update_calls, 2);
    EXPECT_EQ(mock::state().close_calls, 1);
}

TEST_F(SystemTest, DriverNames) {
    mock::state().driver_names = {"Speakers", std::string(400, 'h')};
    auto system = System::create();
    ASSERT_TRUE(system.has_value());

    EXPECT_EQ(*(*system)->num_drivers(), 2);
    EXPECT_EQ(*(*system)->driver_name(0), "Speakers");
    EXPECT_EQ(mock::state().driver_info_calls, 1);

    // Longer than the first buffer: one retry with a doubled buffer
    auto long_name = (*system)->driver_name(1);
    ASSERT_TRUE(long_name.has_value());
    EXPECT_EQ(long_name->size(), 400u);
    EXPECT_EQ(mock::state().driver_info_calls, 3);

    EXPECT_FALSE((*system)->driver_name(7).has_value());
}

TEST_F(SystemTest, MasterGroupIsNeverReleased) {
    FMOD_CHANNELGROUP* master = nullptr;
    {
        auto system = System::create();
        ASSERT_TRUE(system.has_value());
        auto group = (*system)->master_channel_group();
        ASSERT_TRUE(group.has_value());
        master = group->as_raw();
        EXPECT_EQ(*group->name(), "Master");
    }
    EXPECT_EQ(mock::release_count(master), 0);
}

TEST_F(SystemTest, CreatedGroupIsReleasedWithItsHandle) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());

    FMOD_CHANNELGROUP* raw = nullptr;
    {
        auto group = (*system)->create_channel_group("Voices");
        ASSERT_TRUE(group.has_value());
        raw = group->as_raw();
        EXPECT_EQ(*(*group)->name(), "Voices");
    }
    EXPECT_EQ(mock::release_count(raw), 1);
}

TEST_F(SystemTest, SoundsAndSyncPoints) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());

    mock::state().sound_length = 2500;
    mock::state().sync_points = {{"intro", 0}, {"loop_start", 1200}};
    auto sound = (*system)->create_sound("music/theme.ogg");
    ASSERT_TRUE(sound.has_value());

    EXPECT_EQ(*(*sound)->name(), "music/theme.ogg");
    EXPECT_EQ(*(*sound)->length(), 2500u);
    EXPECT_EQ(*(*sound)->num_sync_points(), 2);
    EXPECT_EQ(*(*sound)->sync_point_name(1), "loop_start");
    EXPECT_EQ(*(*sound)->sync_point_offset(1), 1200u);

    auto missing = (*sound)->sync_point_name(5);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), FMOD_ERR_INVALID_PARAM);
}

TEST_F(SystemTest, SoundCreationFailure) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());

    mock::state().create_sound_result = FMOD_ERR_FILE_NOTFOUND;
    auto sound = (*system)->create_stream("missing.wav");
    ASSERT_FALSE(sound.has_value());
    EXPECT_EQ(sound.error().kind(), ErrorKind::IO);
}

TEST_F(SystemTest, StreamOpenState) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    auto stream = (*system)->create_stream("radio.mp3", FMOD_NONBLOCKING);
    ASSERT_TRUE(stream.has_value());

    mock::state().open_state = FMOD_OPENSTATE_LOADING;
    mock::state().percent_buffered = 40;
    auto state = (*stream)->open_state();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->state, FMOD_OPENSTATE_LOADING);
    EXPECT_EQ(state->percent_buffered, 40u);
    EXPECT_TRUE(state->disk_busy);

    mock::state().open_state = FMOD_OPENSTATE_ERROR;
    auto failed = (*stream)->open_state();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), FMOD_ERR_FILE_NOTFOUND);
}

TEST_F(SystemTest, PlaySoundReturnsAChannelOnTheRightGroup) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    auto sound = (*system)->create_sound("click.wav");
    auto sfx = (*system)->create_channel_group("Sfx");
    ASSERT_TRUE(sound.has_value());
    ASSERT_TRUE(sfx.has_value());

    auto channel = (*system)->play_sound(sound->get(), sfx->get(), true);
    ASSERT_TRUE(channel.has_value());
    EXPECT_TRUE(*channel->paused());

    auto current = channel->current_sound();
    ASSERT_TRUE(current.has_value());
    ASSERT_TRUE(current->has_value());
    EXPECT_TRUE(**current == sound->get());
    EXPECT_TRUE(*channel->channel_group() == sfx->get());
    EXPECT_EQ(*(*sfx)->num_channels(), 1);

    auto on_master = (*system)->play_sound(sound->get());
    ASSERT_TRUE(on_master.has_value());
    EXPECT_TRUE(*on_master->channel_group() == *(*system)->master_channel_group());

    auto system_view = channel->system_object();
    ASSERT_TRUE(system_view.has_value());
    EXPECT_TRUE(*system_view == system->get());
}

TEST_F(SystemTest, GeometrySaveAndLoad) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    auto geometry = (*system)->create_geometry(4, 16);
    ASSERT_TRUE(geometry.has_value());

    std::vector<Vector> square = {{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0}};
    auto index = (*geometry)->add_polygon(1.0f, 0.5f, true, square);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(*index, 0);
    EXPECT_EQ(*(*geometry)->num_polygons(), 1);
    EXPECT_EQ((*geometry)->max_polygons()->max_vertices, 16);

    mock::state().geometry_blob = {9, 8, 7, 6};
    auto blob = (*geometry)->save();
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(*blob, (std::vector<uint8_t>{9, 8, 7, 6}));

    auto loaded = (*system)->load_geometry(*blob);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(mock::state().geometries[loaded->as_raw()].loaded_from, *blob);
}

TEST_F(SystemTest, GeometryEdgeCases) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    auto geometry = (*system)->create_geometry(1, 8);
    ASSERT_TRUE(geometry.has_value());

    std::vector<Vector> line = {{0, 0, 0}, {1, 0, 0}};
    auto degenerate = (*geometry)->add_polygon(1.0f, 1.0f, false, line);
    ASSERT_FALSE(degenerate.has_value());
    EXPECT_EQ(degenerate.error().code(), FMOD_ERR_INVALID_PARAM);
    EXPECT_EQ(*(*geometry)->num_polygons(), 0);

    auto empty = (*system)->load_geometry({});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code(), FMOD_ERR_INVALID_PARAM);

    mock::state().geometry_blob = {1, 2, 3};
    mock::state().geometry_save_size_delta = 5;
    auto resized = (*geometry)->save();
    ASSERT_FALSE(resized.has_value());
    EXPECT_EQ(resized.error().code(), FMOD_ERR_INVALID_PARAM);

    ASSERT_TRUE((*geometry)->set_active(false).has_value());
    EXPECT_FALSE(*(*geometry)->active());
}

TEST_F(SystemTest, GeometryOcclusionQuery) {
    auto system = System::create();
    ASSERT_TRUE(system.has_value());
    auto occlusion = (*system)->geometry_occlusion(Vector{0, 0, 0}, Vector{0, 0, 10});
    ASSERT_TRUE(occlusion.has_value());
    EXPECT_FLOAT_EQ(occlusion->direct, 0.25f);
    EXPECT_FLOAT_EQ(occlusion->reverb, 0.5f);
}
