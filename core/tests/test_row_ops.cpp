#include "rref_core/rref_core.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <string>
#include <vector>

using rref_core::ErrorCode;
using rref_core::Matrix;
using rref_core::Rational;
using rref_core::RowOp;
using rref_core::RowOpKind;
using rref_core::Step;
using rref_core::StepKind;

static Matrix from_cells(const rref_core::CellMatrix& cells) {
		Matrix m;
		assert(rref_core::is_ok(rref_core::cells_to_matrix(cells, &m)));
		return m;
}

static RowOp make_op(RowOpKind kind, std::size_t target, std::size_t source, const char* scalar) {
		RowOp op;
		op.kind = kind;
		op.target_row = target;
		op.source_row = source;
		op.scalar = rref_core::rational_parse(scalar);
		return op;
}

int main() {
#ifdef NDEBUG
		rref_test::print_str("[test_row_ops] NDEBUG defined (asserts off)");
#else
		rref_test::print_str("[test_row_ops] NDEBUG not defined (asserts on)");
#endif

		// elementary operations
		{
				Matrix m = from_cells({{"1", "2", "3"}, {"4", "5", "6"}});

				rref_core::apply_swap(m.mut_view(), 0, 1);
				assert(rref_core::matrix_equal(m.view(), from_cells({{"4", "5", "6"}, {"1", "2", "3"}}).view()));
				rref_core::apply_swap(m.mut_view(), 1, 1);
				assert(rref_core::matrix_equal(m.view(), from_cells({{"4", "5", "6"}, {"1", "2", "3"}}).view()));

				assert(rref_core::apply_scale(m.mut_view(), 0, rref_core::rational_parse("1/4")) == ErrorCode::Ok);
				assert(rref_core::matrix_equal(m.view(), from_cells({{"1", "5/4", "3/2"}, {"1", "2", "3"}}).view()));

				assert(rref_core::apply_addmul(m.mut_view(), 1, 0, Rational::from_int(-1)) == ErrorCode::Ok);
				assert(rref_core::matrix_equal(m.view(), from_cells({{"1", "5/4", "3/2"}, {"0", "3/4", "3/2"}}).view()));
				rref_test::print_matrix("after ops", m.view());
		}

		// apply_row_op dispatch and bounds
		{
				Matrix m = from_cells({{"2", "4"}, {"1", "3"}});
				assert(rref_core::apply_row_op(m.mut_view(), make_op(RowOpKind::Swap, 0, 1, "0")) == ErrorCode::Ok);
				assert(rref_core::apply_row_op(m.mut_view(), make_op(RowOpKind::Scale, 1, 1, "1/2")) == ErrorCode::Ok);
				assert(rref_core::apply_row_op(m.mut_view(), make_op(RowOpKind::Replace, 0, 1, "-1")) == ErrorCode::Ok);
				assert(rref_core::matrix_equal(m.view(), from_cells({{"0", "1"}, {"1", "2"}}).view()));

				assert(rref_core::apply_row_op(m.mut_view(), make_op(RowOpKind::Swap, 0, 2, "0")) == ErrorCode::IndexOutOfRange);
				assert(rref_core::apply_row_op(m.mut_view(), make_op(RowOpKind::Scale, 5, 0, "2")) == ErrorCode::IndexOutOfRange);
				assert(rref_core::apply_row_op(m.mut_view(), make_op(RowOpKind::Replace, 1, 9, "2")) == ErrorCode::IndexOutOfRange);
				assert(rref_core::apply_row_op({2, 2, 2, nullptr}, make_op(RowOpKind::Swap, 0, 1, "0")) == ErrorCode::Internal);
		}

		// plain text captions (1 based rows, subscripted E indices)
		{
				assert(rref_core::row_op_caption(make_op(RowOpKind::Swap, 0, 2, "0")) == "[Type I] E₁₃ : Swap R1 ↔ R3");
				assert(rref_core::row_op_caption(make_op(RowOpKind::Scale, 1, 1, "-1/2")) == "[Type II] E₂(-1/2) : Multiply R2 by -1/2");
				assert(rref_core::row_op_caption(make_op(RowOpKind::Replace, 1, 0, "3")) == "[Type III] E₂₁(3) : R2 + (3) × R1");
				assert(rref_core::row_op_caption(make_op(RowOpKind::Replace, 9, 0, "-2")) == "[Type III] E₁₀₁(-2) : R10 + (-2) × R1");
		}

#if RREF_CORE_ENABLE_LATEX
		// latex captions
		{
				std::string tex;
				assert(rref_core::row_op_caption_latex(make_op(RowOpKind::Swap, 0, 1, "0"), &tex) == ErrorCode::Ok);
				assert(tex == "$R_{1} \\leftrightarrow R_{2}$");
				assert(rref_core::row_op_caption_latex(make_op(RowOpKind::Scale, 0, 0, "1/3"), &tex) == ErrorCode::Ok);
				assert(tex == "$R_{1} \\leftarrow (\\frac{1}{3}) R_{1}$");
				assert(rref_core::row_op_caption_latex(make_op(RowOpKind::Replace, 2, 0, "-5"), &tex) == ErrorCode::Ok);
				assert(tex == "$R_{3} \\leftarrow R_{3} + (-5) R_{1}$");
				assert(rref_core::row_op_caption_latex(make_op(RowOpKind::Swap, 0, 1, "0"), nullptr) == ErrorCode::Internal);
		}
#endif

		// steps: construction, highlight rows, row op round trip
		{
				Matrix m = from_cells({{"1", "2"}, {"3", "4"}});

				Step initial;
				assert(rref_core::step_make_initial(m.view(), &initial) == ErrorCode::Ok);
				assert(initial.kind == StepKind::Initial);
				assert(rref_core::step_highlight_rows(initial).empty());
				assert(!rref_core::step_has_scalar(initial));
				RowOp none;
				assert(rref_core::step_row_op(initial, &none) == ErrorCode::Internal);

				// the snapshot does not follow later changes of the source
				m.at_mut(0, 0) = Rational::from_int(100);
				assert(initial.matrix.at(0, 0) == Rational::from_int(1));

				Step swap;
				assert(rref_core::step_make_op(make_op(RowOpKind::Swap, 0, 1, "7"), m.view(), &swap) == ErrorCode::Ok);
				assert(swap.kind == StepKind::Swap);
				assert(swap.scalar.is_zero());
				assert((rref_core::step_highlight_rows(swap) == std::vector<std::size_t>{0, 1}));

				Step scale;
				assert(rref_core::step_make_op(make_op(RowOpKind::Scale, 1, 0, "2"), m.view(), &scale) == ErrorCode::Ok);
				assert(scale.kind == StepKind::Scale);
				assert(scale.source_row == 0);
				assert(rref_core::step_has_scalar(scale));
				assert((rref_core::step_highlight_rows(scale) == std::vector<std::size_t>{1}));

				Step replace;
				assert(rref_core::step_make_op(make_op(RowOpKind::Replace, 1, 0, "-3"), m.view(), &replace) == ErrorCode::Ok);
				assert((rref_core::step_highlight_rows(replace) == std::vector<std::size_t>{1, 0}));

				RowOp back;
				assert(rref_core::step_row_op(replace, &back) == ErrorCode::Ok);
				assert(back.kind == RowOpKind::Replace);
				assert(back.target_row == 1 && back.source_row == 0);
				assert(back.scalar == Rational::from_int(-3));

				assert(rref_core::step_make_initial(m.view(), nullptr) == ErrorCode::Internal);
				assert(rref_core::step_make_op(back, m.view(), nullptr) == ErrorCode::Internal);
		}

		// replay
		{
				Matrix input = from_cells({{"0", "2", "4"}, {"1", "1", "1"}});

				std::vector<Step> steps(1);
				assert(rref_core::step_make_initial(input.view(), &steps[0]) == ErrorCode::Ok);

				Matrix work = input;
				const RowOp ops[] = {
								make_op(RowOpKind::Swap, 0, 1, "0"),
								make_op(RowOpKind::Scale, 1, 1, "1/2"),
								make_op(RowOpKind::Replace, 0, 1, "-1"),
				};
				for (const RowOp& op : ops) {
						assert(rref_core::apply_row_op(work.mut_view(), op) == ErrorCode::Ok);
						Step s;
						assert(rref_core::step_make_op(op, work.view(), &s) == ErrorCode::Ok);
						steps.push_back(s);
				}

				for (std::size_t n = 0; n <= steps.size(); n++) {
						Matrix replayed;
						assert(rref_core::replay_steps(input.view(), steps, n, &replayed) == ErrorCode::Ok);
						const Matrix& expected = (n == 0) ? input : steps[n - 1].matrix;
						assert(rref_core::matrix_equal(replayed.view(), expected.view()));
				}

				Matrix replayed;
				assert(rref_core::replay_steps(input.view(), steps, steps.size() + 1, &replayed) == ErrorCode::StepOutOfRange);
				assert(rref_core::replay_steps(input.view(), steps, 1, nullptr) == ErrorCode::Internal);

				// a step naming a row the input does not have
				std::vector<Step> bad = steps;
				bad[1].source_row = 7;
				assert(rref_core::replay_steps(input.view(), bad, bad.size(), &replayed) == ErrorCode::IndexOutOfRange);
		}

		return 0;
}
