#include "console/command.hpp"

#include <gtest/gtest.h>

namespace maze::console::gtest {

TEST(Command, KeyMapping) {
	EXPECT_EQ(parseCommand('w'), Command::Up);
	EXPECT_EQ(parseCommand('s'), Command::Down);
	EXPECT_EQ(parseCommand('a'), Command::Left);
	EXPECT_EQ(parseCommand('d'), Command::Right);
	EXPECT_EQ(parseCommand('u'), Command::Undo);
	EXPECT_EQ(parseCommand('h'), Command::Hint);
	EXPECT_EQ(parseCommand('q'), Command::Quit);
}

TEST(Command, CaseInsensitive) {
	EXPECT_EQ(parseCommand('W'), Command::Up);
	EXPECT_EQ(parseCommand('D'), Command::Right);
	EXPECT_EQ(parseCommand('Q'), Command::Quit);
}

TEST(Command, UnknownKeys) {
	EXPECT_FALSE(parseCommand('x'));
	EXPECT_FALSE(parseCommand('1'));
	EXPECT_FALSE(parseCommand(' '));
	EXPECT_FALSE(parseCommand('\n'));
	EXPECT_FALSE(parseCommand('\xff'));
}

TEST(Command, ArrowKeys) {
	EXPECT_EQ(parseArrowKey('A'), Command::Up);
	EXPECT_EQ(parseArrowKey('B'), Command::Down);
	EXPECT_EQ(parseArrowKey('C'), Command::Right);
	EXPECT_EQ(parseArrowKey('D'), Command::Left);
	EXPECT_FALSE(parseArrowKey('a'));
	EXPECT_FALSE(parseArrowKey('Z'));
}

TEST(Command, ToDirection) {
	EXPECT_EQ(toDirection(Command::Up), Direction::Up);
	EXPECT_EQ(toDirection(Command::Down), Direction::Down);
	EXPECT_EQ(toDirection(Command::Left), Direction::Left);
	EXPECT_EQ(toDirection(Command::Right), Direction::Right);
	EXPECT_FALSE(toDirection(Command::Undo));
	EXPECT_FALSE(toDirection(Command::Hint));
	EXPECT_FALSE(toDirection(Command::Quit));
}

} // namespace maze::console::gtest
