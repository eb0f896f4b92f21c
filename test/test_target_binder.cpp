#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using namespace column_lineage;
using namespace column_lineage::test;

static Lineage Extract(const PlanNodePtr &plan) {
	auto result = ExtractLineage(*plan, nullptr);
	if (result.HasError()) {
		FAIL(result.GetError().ToString());
	}
	return result.GetLineage();
}

TEST_CASE("INSERT binds destination columns by position", "[binder]") {
	TestPlanBuilder builder;
	auto t0 = builder.Table("t0", {"key", "value"});
	auto query = builder.Project(t0, {{"value", Ref(t0, "value")}, {"key", Ref(t0, "key")}});
	auto command_type = GENERATE(CommandType::INSERT, CommandType::INSERT_OVERWRITE);
	auto plan = builder.Command(command_type, "t1", {"a", "b"}, query);

	auto lineage = Extract(plan);
	REQUIRE(Names(lineage.sources) == std::vector<std::string> {"default.t0"});
	REQUIRE(Names(lineage.targets) == std::vector<std::string> {"default.t1"});
	REQUIRE(ColumnNames(lineage) == std::vector<std::string> {"default.t1.a", "default.t1.b"});
	REQUIRE(SourcesOf(lineage, 0) == std::set<std::string> {"default.t0.value"});
	REQUIRE(SourcesOf(lineage, 1) == std::set<std::string> {"default.t0.key"});
}

TEST_CASE("Constant and scalar subquery inserts", "[binder]") {
	TestPlanBuilder builder;
	auto t2 = builder.Table("t2", {"a", "b"});
	auto counted = builder.Aggregate(
	    t2, {}, {{"c", Agg("count", {Func("ifnull", {Func("json_extract", {Ref(t2, "a"), Lit("'$.x'")}), Lit("''")})}, true)}});
	auto values = builder.Values({});
	auto query = builder.Project(values, {{"1", Lit("1")}, {"2", Lit("2")}, {"c", Scalar(counted)}});
	auto plan = builder.Command(CommandType::INSERT, "t1", {"a", "b", "c"}, query);

	auto lineage = Extract(plan);
	REQUIRE(Names(lineage.sources) == std::vector<std::string> {"default.t2"});
	REQUIRE(SourcesOf(lineage, 0) == NoSources());
	REQUIRE(SourcesOf(lineage, 1) == NoSources());
	REQUIRE(SourcesOf(lineage, 2) == std::set<std::string> {"default.t2.a"});
}

TEST_CASE("Static partition columns have no sources", "[binder]") {
	TestPlanBuilder builder;
	auto t0 = builder.Table("t0", {"key", "value"});
	auto query = builder.Project(t0, {{"key", Ref(t0, "key")}, {"value", Ref(t0, "value")}});

	SECTION("static partition consumes no position") {
		auto plan = builder.Command(CommandType::INSERT, "t1", {"key", "value", "col2"}, query);
		plan->static_partitions["col2"] = "'bb'";
		auto lineage = Extract(plan);
		REQUIRE(SourcesOf(lineage, 0) == std::set<std::string> {"default.t0.key"});
		REQUIRE(SourcesOf(lineage, 1) == std::set<std::string> {"default.t0.value"});
		REQUIRE(SourcesOf(lineage, 2) == NoSources());
	}
	SECTION("leading static partition") {
		auto plan = builder.Command(CommandType::INSERT, "t1", {"COL2", "key", "value"}, query);
		plan->static_partitions["col2"] = "'bb'";
		auto lineage = Extract(plan);
		REQUIRE(SourcesOf(lineage, 0) == NoSources());
		REQUIRE(SourcesOf(lineage, 1) == std::set<std::string> {"default.t0.key"});
		REQUIRE(SourcesOf(lineage, 2) == std::set<std::string> {"default.t0.value"});
	}
	SECTION("dynamic partition binds positionally") {
		auto dynamic = builder.Project(t0, {{"key", Ref(t0, "key")}, {"value", Ref(t0, "value")}, {"p", Ref(t0, "value")}});
		auto plan = builder.Command(CommandType::INSERT, "t1", {"key", "value", "col2"}, dynamic);
		auto lineage = Extract(plan);
		REQUIRE(SourcesOf(lineage, 2) == std::set<std::string> {"default.t0.value"});
	}
}

TEST_CASE("Arity mismatches between query and destination", "[binder]") {
	TestPlanBuilder builder;
	auto t0 = builder.Table("t0", {"a", "b", "c"});

	SECTION("extra query outputs are ignored") {
		auto plan = builder.Command(CommandType::INSERT, "t1", {"x"}, t0);
		auto lineage = Extract(plan);
		REQUIRE(lineage.columns.size() == 1);
		REQUIRE(SourcesOf(lineage, 0) == std::set<std::string> {"default.t0.a"});
	}
	SECTION("unbound destination columns have no sources") {
		auto query = builder.Project(t0, {{"a", Ref(t0, "a")}});
		auto plan = builder.Command(CommandType::INSERT, "t1", {"x", "y"}, query);
		auto lineage = Extract(plan);
		REQUIRE(lineage.columns.size() == 2);
		REQUIRE(SourcesOf(lineage, 1) == NoSources());
	}
}

TEST_CASE("CTAS and views take names from the query or the column list", "[binder]") {
	TestPlanBuilder builder;
	auto t = builder.Table("test_db.t", {"key", "value"});
	auto query = builder.Project(t, {{"k", Ref(t, "key")}, {"v", Func("concat", {Ref(t, "value"), Lit("'!'")})}});

	SECTION("CTAS") {
		auto lineage = Extract(builder.Command(CommandType::CREATE_TABLE_AS_SELECT, "test_db.t2", {}, query));
		REQUIRE(Names(lineage.targets) == std::vector<std::string> {"test_db.t2"});
		REQUIRE(ColumnNames(lineage) == std::vector<std::string> {"test_db.t2.k", "test_db.t2.v"});
		REQUIRE(SourcesOf(lineage, 1) == std::set<std::string> {"test_db.t.value"});
	}
	SECTION("view with a column list") {
		auto command_type = GENERATE(CommandType::CREATE_VIEW, CommandType::ALTER_VIEW);
		auto lineage = Extract(builder.Command(command_type, "v", {"a", "b"}, query));
		REQUIRE(Names(lineage.targets) == std::vector<std::string> {"default.v"});
		REQUIRE(ColumnNames(lineage) == std::vector<std::string> {"default.v.a", "default.v.b"});
		REQUIRE(SourcesOf(lineage, 0) == std::set<std::string> {"test_db.t.key"});
	}
}

TEST_CASE("CREATE TABLE without a query is an empty lineage", "[binder]") {
	TestPlanBuilder builder;
	auto plan = builder.Command(CommandType::CREATE_TABLE, "t", {"a", "b"}, nullptr);

	auto lineage = Extract(plan);
	REQUIRE(lineage.IsEmpty());
	REQUIRE(lineage == Lineage());
}

TEST_CASE("Directory sinks render as backticked paths", "[binder]") {
	TestPlanBuilder builder;
	auto t = builder.Table("t", {"key"});
	auto plan = std::make_shared<CommandNode>(CommandType::INSERT_DIRECTORY, QualifiedName::Path("/tmp/out"),
	                                          std::vector<std::string> {"key"}, std::vector<PlanNodePtr> {t});

	auto lineage = Extract(plan);
	REQUIRE(Names(lineage.targets) == std::vector<std::string> {"`/tmp/out`"});
	REQUIRE(ColumnNames(lineage) == std::vector<std::string> {"`/tmp/out`.key"});
	REQUIRE(SourcesOf(lineage, 0) == std::set<std::string> {"default.t.key"});
}

TEST_CASE("A command without a target is an invalid plan", "[binder]") {
	TestPlanBuilder builder;
	auto t = builder.Table("t", {"a"});
	auto plan = std::make_shared<CommandNode>(CommandType::INSERT, QualifiedName(), std::vector<std::string> {"a"},
	                                          std::vector<PlanNodePtr> {t});

	auto result = ExtractLineage(*plan, nullptr);
	REQUIRE(result.HasError());
	REQUIRE(result.GetError().type == LineageErrorType::INVALID_PLAN);
}

TEST_CASE("MERGE unions the assignments of every clause", "[binder]") {
	TestPlanBuilder builder;
	auto source = builder.Table("source_t", {"id", "name", "price"});
	auto target = builder.Table("target_t", {"id", "name", "price"});
	auto plan = builder.Command(CommandType::MERGE_INTO, "target_t", {"id", "name", "price"}, source);
	plan->children.push_back(target);

	MergeAction update;
	update.clause = MergeClause::MATCHED;
	update.action_type = MergeActionType::UPDATE;
	update.condition = Func("=", {Ref(target, "id"), Ref(source, "id")});
	update.assignments.push_back(MergeAssignment("name", Ref(source, "name")));
	update.assignments.push_back(MergeAssignment("price", Func("+", {Ref(target, "price"), Lit("1")})));
	plan->merge_actions.push_back(update);

	MergeAction remove;
	remove.action_type = MergeActionType::DELETE;
	plan->merge_actions.push_back(remove);

	MergeAction insert;
	insert.clause = MergeClause::NOT_MATCHED;
	insert.action_type = MergeActionType::INSERT;
	insert.assignments.push_back(MergeAssignment("id", Ref(source, "id")));
	insert.assignments.push_back(MergeAssignment("PRICE", Ref(source, "price")));
	plan->merge_actions.push_back(insert);

	auto lineage = Extract(plan);
	REQUIRE(Names(lineage.sources) == std::vector<std::string> {"default.source_t"});
	REQUIRE(Names(lineage.targets) == std::vector<std::string> {"default.target_t"});
	REQUIRE(SourcesOf(lineage, 0) == std::set<std::string> {"default.source_t.id"});
	REQUIRE(SourcesOf(lineage, 1) == std::set<std::string> {"default.source_t.name"});
	REQUIRE(SourcesOf(lineage, 2) == std::set<std::string> {"default.source_t.price"});
}

TEST_CASE("MERGE star clauses assign positionally", "[binder]") {
	TestPlanBuilder builder;
	auto source = builder.Table("source_t", {"a", "b"});
	auto pivot = builder.Table("pivot_t", {"a", "c"});
	auto joined = builder.Project(builder.Join(JoinType::INNER, source, pivot, Func("=", {Ref(source, "a"), Ref(pivot, "a")})),
	                              {{"a", Ref(source, "a")}, {"c", Ref(pivot, "c")}});
	auto plan = builder.Command(CommandType::MERGE_INTO, "target_t", {"x", "y"}, joined);

	MergeAction update;
	update.action_type = MergeActionType::UPDATE;
	update.is_star = true;
	plan->merge_actions.push_back(update);
	MergeAction insert;
	insert.clause = MergeClause::NOT_MATCHED;
	insert.action_type = MergeActionType::INSERT;
	insert.is_star = true;
	plan->merge_actions.push_back(insert);

	auto lineage = Extract(plan);
	REQUIRE(Names(lineage.sources) == std::vector<std::string> {"default.source_t", "default.pivot_t"});
	REQUIRE(ColumnNames(lineage) == std::vector<std::string> {"default.target_t.x", "default.target_t.y"});
	REQUIRE(SourcesOf(lineage, 0) == std::set<std::string> {"default.source_t.a"});
	REQUIRE(SourcesOf(lineage, 1) == std::set<std::string> {"default.pivot_t.c"});
}

TEST_CASE("MERGE assigning an unknown column is an invalid plan", "[binder]") {
	TestPlanBuilder builder;
	auto source = builder.Table("source_t", {"a"});
	auto plan = builder.Command(CommandType::MERGE_INTO, "target_t", {"a"}, source);
	MergeAction update;
	update.assignments.push_back(MergeAssignment("missing", Ref(source, "a")));
	plan->merge_actions.push_back(update);

	auto result = ExtractLineage(*plan, nullptr);
	REQUIRE(result.HasError());
	REQUIRE(result.GetError().type == LineageErrorType::INVALID_PLAN);
}
