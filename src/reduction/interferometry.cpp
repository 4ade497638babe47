#include "grating_reduce/reduction/interferometry.hpp"
#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/core/utils.hpp"

namespace grating_reduce::reduction {

InterferometryMaps derive_interferometry(const ReductionResult& sample,
                                         const ReductionResult& ob) {
    const Shape ss = Shape::of(sample.offset);
    const Shape os = Shape::of(ob.offset);
    if (ss != os || Shape::of(sample.amplitude) != ss || Shape::of(sample.phase) != ss ||
        Shape::of(ob.amplitude) != os || Shape::of(ob.phase) != os) {
        throw ShapeMismatchError("sample reduction is " + shape_to_string(ss) +
                                 ", ob reduction is " + shape_to_string(os));
    }

    const Eigen::ArrayXXd s_offset = core::replace_non_finite(sample.offset).array();
    const Eigen::ArrayXXd o_offset = core::replace_non_finite(ob.offset).array();
    const Eigen::ArrayXXd s_amp = sample.amplitude.array();
    const Eigen::ArrayXXd o_amp = ob.amplitude.array();

    InterferometryMaps maps;
    maps.transmission = (s_offset / o_offset).matrix();
    maps.diff_phase_contrast =
        (sample.phase.array() - ob.phase.array()).tan().atan().matrix();
    maps.dark_field = ((s_amp / s_offset) / (o_amp / o_offset)).matrix();
    maps.visibility_map = (o_amp / o_offset).matrix();
    return maps;
}

} // namespace grating_reduce::reduction
