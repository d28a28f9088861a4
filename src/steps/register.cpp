#include "shroud/steps.hpp"

namespace shroud {

void register_builtin_steps(StepRegistry& registry){
    registry.add("EncryptStrings", make_encrypt_strings);
    registry.add("ConstantArray", make_constant_array);
    registry.add("NumbersToExpressions", make_numbers_to_expressions);
    registry.add("ProxifyLocals", make_proxify_locals);
    registry.add("AntiTamper", make_anti_tamper);
    registry.add("WrapInFunction", make_wrap_in_function);
}

} // namespace shroud
