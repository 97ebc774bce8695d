#ifndef PRYZMA_X86_DECODER_HH
#define PRYZMA_X86_DECODER_HH

#include <pryzma/Error.hh>
#include <pryzma/support/SourceManager.hh>
#include <pryzma/x86/Instruction.hh>

namespace pryzma::x86
{
	// Decodes the Intel-syntax text inside `body` (the span of an assembly
	// body, braces included). Every instruction is checked before anything
	// runs: an unknown mnemonic is UnsupportedOpcode, a bad operand is a
	// ParseError and a jump to a missing label is UndefinedNameError.
	[[nodiscard]] ErrorOr<AsmProgram> decode(SourceManager const& sources, SourceSpan body);

} // namespace pryzma::x86

#endif /* PRYZMA_X86_DECODER_HH */
