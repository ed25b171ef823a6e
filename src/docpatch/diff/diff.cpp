#include <docpatch/diff/diff.h>

#include <docpatch/diff/dispatch.h>
#include <docpatch/diff/pointer_tracker.h>
#include <docpatch/utilities/logging.h>

namespace docpatch {

patch
compute_patch(
    value_ref old_value, value_ref new_value, diff_config const& config)
{
    auto logger = get_logger();

    if (resolve(old_value).is_absent() && resolve(new_value).is_absent())
        DOCPATCH_THROW(nil_pair());

    pointer_tracker tracker;
    if (config.detect_pointer_sharing)
    {
        tracker.track(true, old_value);
        tracker.track(false, new_value);
    }

    patch result;
    detail::diff_context ctx(config, result);
    detail::compare_values(ctx, string(), old_value, new_value);

    if (config.detect_pointer_sharing)
    {
        auto sharing = tracker.find_sharing();
        if (sharing)
        {
            DOCPATCH_THROW(
                pointer_sharing_detected()
                << field_path_info(sharing->new_path)
                << old_field_path_info(sharing->old_path)
                << pointer_address_info(
                       reinterpret_cast<uintptr_t>(sharing->address))
                << error_message_info(describe_pointer_sharing(*sharing)));
        }
    }

    logger->debug(
        "computed patch with {} operation(s) on {} field(s)",
        result.metadata().total_changes,
        result.metadata().fields_changed.size());
    return result;
}

} // namespace docpatch
